#include "core/FeedSourceSet.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <ada.h>

namespace newsfeed {
namespace core {

FeedSourceSet::FeedSourceSet(const std::filesystem::path& storageFile)
    : storageFile_(storageFile) {
    load();
}

std::vector<FeedEndpoint> FeedSourceSet::defaultFeeds() {
    return {
        FeedEndpoint("http://feeds.arstechnica.com/arstechnica/index", "Ars Technica"),
        FeedEndpoint("https://boingboing.net/feed", "Boing Boing"),
        FeedEndpoint("http://rss.slashdot.org/Slashdot/slashdotMain", "Slashdot"),
        FeedEndpoint("https://hackaday.com/blog/feed/", "Hackaday"),
        FeedEndpoint("https://www.phoronix.com/rss.php", "Phoronix"),
        FeedEndpoint("https://www.newyorker.com/feed/everything", "The New Yorker")
    };
}

std::string FeedSourceSet::cleanAndValidateUrl(const std::string& url) {
    if (url.empty()) {
        return "";
    }

    // Trim whitespace
    std::string cleaned = url;
    cleaned.erase(0, cleaned.find_first_not_of(" \t\n\r"));
    cleaned.erase(cleaned.find_last_not_of(" \t\n\r") + 1);

    if (cleaned.empty()) {
        return "";
    }

    auto parsed_url = ada::parse<ada::url>(cleaned);
    if (!parsed_url) {
        return "";
    }

    if (parsed_url->get_protocol() != "http:" && parsed_url->get_protocol() != "https:") {
        return "";
    }

    return parsed_url->get_href();
}

bool FeedSourceSet::addFeed(const std::string& url, const std::string& name) {
    std::string cleaned = cleanAndValidateUrl(url);
    if (cleaned.empty()) {
        std::cerr << "Not a valid http(s) feed URL: " << url << "\n";
        return false;
    }

    for (const auto& feed : feeds_) {
        if (feed.url == cleaned || (!name.empty() && feed.name == name)) {
            std::cout << "Feed with this name or URL already exists\n";
            return false;
        }
    }

    feeds_.emplace_back(cleaned, name);
    save();
    std::cout << "Added feed: " << feeds_.back().label() << "\n";
    return true;
}

bool FeedSourceSet::removeFeed(const std::string& identifier) {
    int index = findFeedIndex(identifier);
    if (index == -1) {
        std::cout << "Feed not found: " << identifier << "\n";
        return false;
    }

    std::string label = feeds_[index].label();
    feeds_.erase(feeds_.begin() + index);
    save();
    std::cout << "Removed feed: " << label << "\n";
    return true;
}

bool FeedSourceSet::setEnabled(const std::string& identifier, bool enabled) {
    int index = findFeedIndex(identifier);
    if (index == -1) {
        std::cout << "Feed not found: " << identifier << "\n";
        return false;
    }

    feeds_[index].enabled = enabled;
    save();
    return true;
}

std::vector<FeedEndpoint> FeedSourceSet::enabledFeeds() const {
    std::vector<FeedEndpoint> enabled;
    for (const auto& feed : feeds_) {
        if (feed.enabled) {
            enabled.push_back(feed);
        }
    }
    return enabled;
}

void FeedSourceSet::save() const {
    nlohmann::json j;
    j["feeds"] = nlohmann::json::array();
    for (const auto& feed : feeds_) {
        j["feeds"].push_back(feed.toJson());
    }

    if (storageFile_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(storageFile_.parent_path(), ec);
        if (ec) {
            throw ConfigurationError("Could not create " + storageFile_.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    std::ofstream file(storageFile_);
    if (!file.is_open()) {
        throw ConfigurationError("Could not open feed list for writing: " + storageFile_.string());
    }
    file << j.dump(4);
    if (!file) {
        throw ConfigurationError("Could not write feed list: " + storageFile_.string());
    }
}

void FeedSourceSet::load() {
    std::ifstream file(storageFile_);
    if (!file.is_open()) {
        // First start, seed the default feeds
        feeds_ = defaultFeeds();
        save();
        std::cout << "Created default feed list at: " << storageFile_.string() << "\n";
        return;
    }

    std::vector<FeedEndpoint> loaded;
    try {
        nlohmann::json j = nlohmann::json::parse(file);

        const auto& feeds = j.at("feeds");
        if (!feeds.is_array()) {
            throw ConfigurationError("\"feeds\" is not an array");
        }
        for (const auto& feedJson : feeds) {
            FeedEndpoint feed = FeedEndpoint::fromJson(feedJson);
            if (cleanAndValidateUrl(feed.url).empty()) {
                std::cerr << "Skipping invalid feed URL: " << feed.url << "\n";
                continue;
            }
            loaded.push_back(feed);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed feed list " + storageFile_.string() + ": " + e.what());
    }

    feeds_ = std::move(loaded);
}

int FeedSourceSet::findFeedIndex(const std::string& identifier) const {
    if (identifier.empty()) {
        return -1;
    }
    // Stored URLs are normalized, so compare against the normalized form too
    const std::string normalized = cleanAndValidateUrl(identifier);
    for (size_t i = 0; i < feeds_.size(); ++i) {
        if (feeds_[i].url == identifier || feeds_[i].name == identifier ||
            (!normalized.empty() && feeds_[i].url == normalized)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace core
} // namespace newsfeed
