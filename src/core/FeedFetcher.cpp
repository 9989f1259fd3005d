#include "core/FeedFetcher.hpp"
#include "core/Errors.hpp"
#include <future>
#include <iostream>
#include <utility>

namespace newsfeed {
namespace core {

FeedFetcher::FeedFetcher(HttpClient& client, WorkerPool& pool)
    : client_(client), pool_(pool) {}

std::vector<RawEntry> FeedFetcher::fetchOne(const FeedEndpoint& endpoint) {
    FeedDocument document;
    document.loadFromUrl(client_, endpoint.url);
    return document.getEntries();
}

FetchResult FeedFetcher::fetchAll(const std::vector<FeedEndpoint>& endpoints) {
    std::vector<std::pair<const FeedEndpoint*, std::future<std::vector<RawEntry>>>> pending;
    pending.reserve(endpoints.size());

    for (const auto& endpoint : endpoints) {
        pending.emplace_back(&endpoint, pool_.submit([this, &endpoint]() {
            return fetchOne(endpoint);
        }));
    }

    FetchResult result;
    for (auto& job : pending) {
        const FeedEndpoint& endpoint = *job.first;
        try {
            std::vector<RawEntry> entries = job.second.get();
            result.entries.insert(result.entries.end(),
                                  std::make_move_iterator(entries.begin()),
                                  std::make_move_iterator(entries.end()));
            ++result.feedsFetched;
        } catch (const FeedFetchError& e) {
            std::cerr << "Error fetching feed " << endpoint.label() << ": " << e.what() << "\n";
            result.failures.push_back({endpoint.url, e.what()});
        } catch (const std::exception& e) {
            std::cerr << "Unexpected error fetching feed " << endpoint.label() << ": " << e.what() << "\n";
            result.failures.push_back({endpoint.url, e.what()});
        }
    }

    return result;
}

} // namespace core
} // namespace newsfeed
