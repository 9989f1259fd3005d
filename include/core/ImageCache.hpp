#pragma once

#include "core/HttpClient.hpp"
#include "core/WorkerPool.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace newsfeed {
namespace core {

enum class ImageStatus {
    AlreadyCached,
    Downloaded,
    Failed
};

struct ImageOutcome {
    std::string url;
    std::filesystem::path path;
    ImageStatus status = ImageStatus::Failed;
    std::string error;
};

// Write-once image store under the cache root. A file that exists is never
// fetched or rewritten again.
class ImageCache {
public:
    ImageCache(const std::filesystem::path& cacheRoot, HttpClient& client, WorkerPool& pool);

    std::optional<std::filesystem::path> pathFor(const std::string& url) const;

    // Download every missing image concurrently. URLs that map to the same
    // path are handled once. Never throws for a single image.
    std::vector<ImageOutcome> ensureCached(const std::vector<std::string>& urls);

    // Handle one URL on the calling thread.
    ImageOutcome cacheOne(const std::string& url);

    // Decode bytes and write them re-encoded to target, through a temporary
    // sibling file. Throws ImageFetchError.
    static void storeImage(const std::string& url, const std::string& bytes,
                           const std::filesystem::path& target);

private:
    void download(const std::string& url, const std::filesystem::path& target);

    std::filesystem::path cacheRoot_;
    HttpClient& client_;
    WorkerPool& pool_;
};

} // namespace core
} // namespace newsfeed
