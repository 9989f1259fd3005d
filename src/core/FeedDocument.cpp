#include "core/FeedDocument.hpp"
#include "core/Errors.hpp"
#include <cstring>
#include <sstream>
#include <pugixml.hpp>

namespace newsfeed {
namespace core {

namespace {

const char* const kMediaNamespace = "http://search.yahoo.com/mrss/";
const char* const kDublinCoreNamespace = "http://purl.org/dc/elements/1.1/";
const char* const kFeedAccept = "application/rss+xml, application/rdf+xml, application/xml, text/xml";

std::optional<std::string> childText(const pugi::xml_node& parent, const char* name) {
    auto node = parent.child(name);
    if (!node) {
        return std::nullopt;
    }
    return std::string(node.text().get());
}

} // namespace

void FeedDocument::loadFromUrl(HttpClient& client, const std::string& url) {
    if (url.empty()) {
        throw FeedFetchError(url, "Empty URL provided");
    }

    HttpResponse response = client.get(url, kFeedAccept);

    if (!response.ok()) {
        std::stringstream err;
        err << "Failed to fetch feed: HTTP " << response.statusCode;
        if (!response.error.empty()) {
            err << " (" << response.error << ")";
        }
        throw FeedFetchError(url, err.str());
    }

    if (response.body.empty()) {
        throw FeedFetchError(url, "Empty response received from feed URL");
    }

    parse(response.body, url);
}

void FeedDocument::resolvePrefixes(const pugi::xml_node& root) {
    mediaPrefix_ = "media";
    dcPrefix_ = "dc";

    for (auto attr : root.attributes()) {
        const char* name = attr.name();
        if (std::strncmp(name, "xmlns:", 6) != 0) {
            continue;
        }
        if (std::strcmp(attr.value(), kMediaNamespace) == 0) {
            mediaPrefix_ = name + 6;
        } else if (std::strcmp(attr.value(), kDublinCoreNamespace) == 0) {
            dcPrefix_ = name + 6;
        }
    }
}

RawEntry FeedDocument::parseEntry(const pugi::xml_node& item) const {
    RawEntry entry;
    entry.title = childText(item, "title");
    entry.description = childText(item, "description");
    entry.pubDate = childText(item, "pubDate");

    const std::string dcDate = dcPrefix_ + ":date";
    for (auto date : item.children(dcDate.c_str())) {
        entry.dublinCoreDates.emplace_back(date.text().get());
    }

    const std::string thumbnail = mediaPrefix_ + ":thumbnail";
    for (auto thumb : item.children(thumbnail.c_str())) {
        entry.thumbnailUrls.emplace_back(thumb.attribute("url").value());
    }

    return entry;
}

void FeedDocument::parse(const std::string& xml, const std::string& sourceUrl) {
    pugi::xml_document doc;
    // Honour the declared encoding; pugixml converts it to UTF-8
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size(),
                                                    pugi::parse_default, pugi::encoding_auto);
    if (!result) {
        throw FeedFetchError(sourceUrl, "Failed to parse XML feed: " + std::string(result.description()));
    }

    // Clear existing data
    entries_.clear();
    title_.clear();
    description_.clear();
    link_.clear();

    // RSS 2.0 keeps items inside the channel, RSS 1.0 (RDF) next to it
    pugi::xml_node root = doc.child("rss");
    pugi::xml_node channel;
    pugi::xml_node itemParent;
    if (root) {
        channel = root.child("channel");
        itemParent = channel;
    } else {
        root = doc.child("rdf:RDF");
        if (root) {
            channel = root.child("channel");
            itemParent = root;
        }
    }

    if (!channel) {
        throw FeedFetchError(sourceUrl, "Invalid feed format: no rss channel or rdf:RDF element found");
    }

    resolvePrefixes(root);

    if (auto title = channel.child("title")) {
        title_ = title.text().get();
    }

    if (auto description = channel.child("description")) {
        description_ = description.text().get();
    }

    if (auto link = channel.child("link")) {
        link_ = link.text().get();
    }

    for (auto item : itemParent.children("item")) {
        entries_.push_back(parseEntry(item));
    }
}

} // namespace core
} // namespace newsfeed
