#include "core/NewsItem.hpp"
#include <stdexcept>

namespace newsfeed {
namespace core {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> readOptionalString(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (value.is_null()) {
        return std::nullopt;
    }
    return value.get<std::string>();
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string digestToHex(const ContentDigest& digest) {
    static const char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (unsigned char byte : digest) {
        hex += kHex[byte >> 4];
        hex += kHex[byte & 0x0f];
    }
    return hex;
}

std::optional<ContentDigest> digestFromHex(const std::string& hex) {
    ContentDigest digest{};
    if (hex.size() != digest.size() * 2) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < digest.size(); ++i) {
        const int high = hexValue(hex[2 * i]);
        const int low = hexValue(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        digest[i] = static_cast<unsigned char>((high << 4) | low);
    }
    return digest;
}

std::string NewsItem::toString() const {
    return title.value_or("") + " - " + description.value_or("");
}

nlohmann::json NewsItem::toJson() const {
    return nlohmann::json{
        {"title", optionalString(title)},
        {"description", optionalString(description)},
        {"rawPublishDate", optionalString(rawPublishDate)},
        {"publishDate", publishDate ? nlohmann::json(publishDate->toIso8601()) : nlohmann::json(nullptr)},
        {"imageUrl", optionalString(imageUrl)},
        {"imagePath", imagePath ? nlohmann::json(imagePath->string()) : nlohmann::json(nullptr)},
        {"digest", digestToHex(digest)}
    };
}

NewsItem NewsItem::fromJson(const nlohmann::json& j) {
    NewsItem item;
    item.title = readOptionalString(j, "title");
    item.description = readOptionalString(j, "description");
    item.rawPublishDate = readOptionalString(j, "rawPublishDate");
    item.imageUrl = readOptionalString(j, "imageUrl");

    if (auto date = readOptionalString(j, "publishDate")) {
        item.publishDate = Timestamp::parseIso8601(*date);
        if (!item.publishDate) {
            throw std::invalid_argument("Invalid publishDate: " + *date);
        }
    }

    if (auto path = readOptionalString(j, "imagePath")) {
        item.imagePath = std::filesystem::path(*path);
    }

    const auto hex = j.at("digest").get<std::string>();
    auto digest = digestFromHex(hex);
    if (!digest) {
        throw std::invalid_argument("Invalid digest: " + hex);
    }
    item.digest = *digest;

    return item;
}

bool sameItem(const NewsItem& a, const NewsItem& b) {
    return a.title == b.title &&
           a.description == b.description &&
           a.rawPublishDate == b.rawPublishDate;
}

bool publishedBefore(const NewsItem& a, const NewsItem& b) {
    if (!b.publishDate) {
        return false;
    }
    if (!a.publishDate) {
        return true;
    }
    return a.publishDate->isBefore(*b.publishDate);
}

} // namespace core
} // namespace newsfeed
