#pragma once

#include "core/HttpClient.hpp"
#include <optional>
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace newsfeed {
namespace core {

// One <item> as served, before normalization.
struct RawEntry {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> pubDate;
    std::vector<std::string> dublinCoreDates;  // dc:date values in document order
    std::vector<std::string> thumbnailUrls;    // media:thumbnail url attributes, "" when missing
};

class FeedDocument {
public:
    FeedDocument() = default;
    ~FeedDocument() = default;

    // Fetch the feed through client and parse it. Throws FeedFetchError.
    void loadFromUrl(HttpClient& client, const std::string& url);

    // Parse an RSS 2.0 or RSS 1.0 (RDF) document. Throws FeedFetchError.
    void parse(const std::string& xml, const std::string& sourceUrl = "");

    const std::vector<RawEntry>& getEntries() const { return entries_; }

    // Get feed metadata
    std::string getTitle() const { return title_; }
    std::string getDescription() const { return description_; }
    std::string getLink() const { return link_; }

private:
    RawEntry parseEntry(const pugi::xml_node& item) const;
    void resolvePrefixes(const pugi::xml_node& root);

    std::string title_;
    std::string description_;
    std::string link_;
    std::string mediaPrefix_;
    std::string dcPrefix_;
    std::vector<RawEntry> entries_;
};

} // namespace core
} // namespace newsfeed
