#pragma once

#include "core/FeedDocument.hpp"
#include "core/FeedEndpoint.hpp"
#include "core/HttpClient.hpp"
#include "core/WorkerPool.hpp"
#include <string>
#include <vector>

namespace newsfeed {
namespace core {

struct FeedFailure {
    std::string url;
    std::string reason;
};

struct FetchResult {
    std::vector<RawEntry> entries;      // Every entry of every feed that loaded
    std::vector<FeedFailure> failures;  // One record per feed that did not
    std::size_t feedsFetched = 0;
};

class FeedFetcher {
public:
    FeedFetcher(HttpClient& client, WorkerPool& pool);

    // Fetch all endpoints concurrently. A failing endpoint is recorded in
    // the result and contributes no entries; it never aborts the others.
    FetchResult fetchAll(const std::vector<FeedEndpoint>& endpoints);

    // Fetch and parse one endpoint. Throws FeedFetchError.
    std::vector<RawEntry> fetchOne(const FeedEndpoint& endpoint);

private:
    HttpClient& client_;
    WorkerPool& pool_;
};

} // namespace core
} // namespace newsfeed
