#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace newsfeed {
namespace core {

// Fixed set of threads draining one task queue.
//
// Feed fetches and image downloads of a run are submitted here. Exceptions
// thrown by a task are delivered through its future. The destructor finishes
// queued tasks before joining.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        std::future<Result> future = packaged->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([packaged]() { (*packaged)(); });
        }
        cv_.notify_one();
        return future;
    }

    std::size_t size() const { return threads_.size(); }

private:
    void workerLoop();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_;
};

} // namespace core
} // namespace newsfeed
