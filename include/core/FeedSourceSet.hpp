#pragma once

#include "core/FeedEndpoint.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace newsfeed {
namespace core {

// The configured feed endpoints, persisted as JSON next to the item store.
class FeedSourceSet {
public:
    // Loads storageFile, seeding it with the default feeds if it does not exist.
    explicit FeedSourceSet(const std::filesystem::path& storageFile);

    // Endpoint management. Identifier can be the URL or the name.
    bool addFeed(const std::string& url, const std::string& name = "");
    bool removeFeed(const std::string& identifier);
    bool setEnabled(const std::string& identifier, bool enabled);

    std::vector<FeedEndpoint> getFeeds() const { return feeds_; }
    std::vector<FeedEndpoint> enabledFeeds() const;
    std::size_t size() const { return feeds_.size(); }

    // Persistence. Both throw ConfigurationError.
    void save() const;
    void load();

    const std::filesystem::path& storageFile() const { return storageFile_; }

    static std::vector<FeedEndpoint> defaultFeeds();

    // Trimmed, normalized http(s) URL, or "" if the input is not one.
    static std::string cleanAndValidateUrl(const std::string& url);

private:
    std::vector<FeedEndpoint> feeds_;
    std::filesystem::path storageFile_;

    int findFeedIndex(const std::string& identifier) const;
};

} // namespace core
} // namespace newsfeed
