#pragma once

#include "core/Timestamp.hpp"
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace newsfeed {
namespace core {

// SHA-256 over title bytes followed by description bytes.
using ContentDigest = std::array<unsigned char, 32>;

std::string digestToHex(const ContentDigest& digest);
std::optional<ContentDigest> digestFromHex(const std::string& hex);

struct NewsItem {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> rawPublishDate;  // Native date text as served
    std::optional<Timestamp> publishDate;
    std::optional<std::string> imageUrl;
    std::optional<std::filesystem::path> imagePath;  // Cached file, may not exist yet
    ContentDigest digest{};

    // "<title> - <description>"
    std::string toString() const;

    // JSON serialization
    nlohmann::json toJson() const;

    // JSON deserialization. Throws nlohmann::json::exception or
    // std::invalid_argument on malformed input.
    static NewsItem fromJson(const nlohmann::json& j);
};

// Identity used for deduplication: title, description and the raw
// publish-date string all equal. Digest and image fields do not take part.
bool sameItem(const NewsItem& a, const NewsItem& b);

// Chronological order on publishDate; an item without a date comes first.
bool publishedBefore(const NewsItem& a, const NewsItem& b);

} // namespace core
} // namespace newsfeed
