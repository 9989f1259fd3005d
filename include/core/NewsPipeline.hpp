#pragma once

#include "core/FeedEndpoint.hpp"
#include "core/FeedFetcher.hpp"
#include "core/HttpClient.hpp"
#include "core/ImageCache.hpp"
#include "core/NewsItem.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace newsfeed {
namespace core {

struct PipelineConfig {
    std::filesystem::path cacheRoot;  // Empty: resolve from the environment
    std::string storeFileName = "news_items.json";
    std::size_t workers = 8;
    std::chrono::milliseconds timeout{30000};
    std::string userAgent = "Mozilla/5.0 (compatible; newsfeed/1.0)";
    bool downloadImages = true;
    bool verbose = true;
};

struct RunReport {
    std::size_t feedsAttempted = 0;
    std::size_t feedsFetched = 0;
    std::vector<FeedFailure> feedFailures;
    std::size_t entriesParsed = 0;
    std::size_t entriesDropped = 0;  // No title or no description
    std::size_t itemsAdded = 0;
    std::size_t itemsStored = 0;
    std::size_t imagesDownloaded = 0;
    std::size_t imagesCached = 0;
    std::vector<ImageOutcome> imageFailures;

    std::string summary() const;
};

struct PipelineResult {
    std::vector<NewsItem> items;  // Newest first
    RunReport report;
};

// One fetch-merge-persist cycle over the configured feeds.
//
// Per-feed, per-entry and per-image problems end up in the report. Cache root
// and store problems throw (ConfigurationError, StoreError) and leave the
// stored collection untouched. Runs against the same cache root must not
// overlap.
class NewsPipeline {
public:
    NewsPipeline(const PipelineConfig& config, std::vector<FeedEndpoint> endpoints);
    NewsPipeline(const PipelineConfig& config, std::vector<FeedEndpoint> endpoints,
                 std::shared_ptr<HttpClient> client);

    PipelineResult run();

    // Stored items newest first, without network access.
    std::vector<NewsItem> storedItems() const;

    std::filesystem::path storePath() const;

private:
    PipelineConfig config_;
    std::vector<FeedEndpoint> endpoints_;
    std::shared_ptr<HttpClient> client_;
};

} // namespace core
} // namespace newsfeed
