#include "core/NewsPipeline.hpp"
#include "core/CacheDirectory.hpp"
#include "core/Errors.hpp"
#include "core/Normalizer.hpp"
#include "core/NewsStore.hpp"
#include "core/WorkerPool.hpp"
#include <iostream>
#include <sstream>
#include <utility>

namespace newsfeed {
namespace core {

std::string RunReport::summary() const {
    std::ostringstream out;
    out << "Fetched " << feedsFetched << "/" << feedsAttempted << " feeds, "
        << entriesParsed << " entries";
    if (entriesDropped > 0) {
        out << " (" << entriesDropped << " dropped)";
    }
    out << ", " << itemsAdded << " new items, " << itemsStored << " stored"
        << ", images: " << imagesDownloaded << " downloaded, "
        << imagesCached << " cached, " << imageFailures.size() << " failed";
    return out.str();
}

NewsPipeline::NewsPipeline(const PipelineConfig& config, std::vector<FeedEndpoint> endpoints)
    : NewsPipeline(config, std::move(endpoints),
                   std::make_shared<CprHttpClient>(config.timeout, config.userAgent)) {}

NewsPipeline::NewsPipeline(const PipelineConfig& config, std::vector<FeedEndpoint> endpoints,
                           std::shared_ptr<HttpClient> client)
    : config_(config), endpoints_(std::move(endpoints)), client_(std::move(client)) {}

std::filesystem::path NewsPipeline::storePath() const {
    return resolveCacheRoot(config_.cacheRoot) / config_.storeFileName;
}

std::vector<NewsItem> NewsPipeline::storedItems() const {
    NewsStore store(storePath());
    std::vector<NewsItem> items = store.load();
    sortNewestFirst(items);
    return items;
}

PipelineResult NewsPipeline::run() {
    const std::filesystem::path root = resolveCacheRoot(config_.cacheRoot);
    ensureCacheRoot(root);

    // A corrupt store aborts before any network traffic
    NewsStore store(root / config_.storeFileName);
    std::vector<NewsItem> existing = store.load();

    RunReport report;
    WorkerPool pool(config_.workers);

    std::vector<FeedEndpoint> enabled;
    for (const auto& endpoint : endpoints_) {
        if (endpoint.enabled) {
            enabled.push_back(endpoint);
        }
    }
    report.feedsAttempted = enabled.size();

    FeedFetcher fetcher(*client_, pool);
    FetchResult fetched = fetcher.fetchAll(enabled);
    report.feedsFetched = fetched.feedsFetched;
    report.feedFailures = std::move(fetched.failures);
    report.entriesParsed = fetched.entries.size();

    std::vector<NewsItem> fresh;
    fresh.reserve(fetched.entries.size());
    for (const auto& entry : fetched.entries) {
        try {
            fresh.push_back(normalize(entry, root));
        } catch (const MissingContentError& e) {
            ++report.entriesDropped;
            if (config_.verbose) {
                std::cout << "Skipping entry: " << e.what() << "\n";
            }
        }
    }

    if (config_.downloadImages) {
        std::vector<std::string> imageUrls;
        for (const auto& item : fresh) {
            if (item.imageUrl && item.imagePath) {
                imageUrls.push_back(*item.imageUrl);
            }
        }

        ImageCache images(root, *client_, pool);
        for (auto& outcome : images.ensureCached(imageUrls)) {
            switch (outcome.status) {
            case ImageStatus::Downloaded:
                ++report.imagesDownloaded;
                break;
            case ImageStatus::AlreadyCached:
                ++report.imagesCached;
                break;
            case ImageStatus::Failed:
                report.imageFailures.push_back(std::move(outcome));
                break;
            }
        }
    }

    MergeResult merged = store.merge(std::move(existing), fresh);
    report.itemsAdded = merged.added;
    report.itemsStored = merged.items.size();

    if (config_.verbose) {
        std::cout << report.summary() << "\n";
    }

    return PipelineResult{std::move(merged.items), std::move(report)};
}

} // namespace core
} // namespace newsfeed
