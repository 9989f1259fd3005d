#pragma once

#include "core/FeedDocument.hpp"
#include "core/NewsItem.hpp"
#include "core/Timestamp.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace newsfeed {
namespace core {

// Drops bytes that do not form well-formed UTF-8 so every stored string
// serializes. Applied to all entry text before it becomes item state.
std::string sanitizeUtf8(const std::string& input);

// SHA-256 over title bytes then description bytes. The order is part of the
// stored format.
ContentDigest contentDigest(const std::string& title, const std::string& description);

// Native pubDate as RFC-822, else the first Dublin Core date as ISO-8601.
std::optional<Timestamp> extractPublishDate(const RawEntry& entry);

// url of the first media:thumbnail, if that attribute is present.
std::optional<std::string> extractImageUrl(const RawEntry& entry);

// Cache location for an image: the URL without its http(s):// prefix,
// joined onto cacheRoot. Query and fragment are dropped. Returns nothing for
// non-http URLs, URLs without a file name, and "." or ".." segments.
std::optional<std::filesystem::path> imagePathForUrl(const std::filesystem::path& cacheRoot,
                                                     const std::string& imageUrl);

// Build the canonical item for one entry. Throws MissingContentError when
// the title or the description is absent.
NewsItem normalize(const RawEntry& entry, const std::filesystem::path& cacheRoot);

} // namespace core
} // namespace newsfeed
