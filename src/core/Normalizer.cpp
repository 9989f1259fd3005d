#include "core/Normalizer.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace newsfeed {
namespace core {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

bool hasPrefixNoCase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::optional<std::string> sanitized(const std::optional<std::string>& value) {
    if (!value) {
        return std::nullopt;
    }
    return sanitizeUtf8(*value);
}

} // namespace

std::string sanitizeUtf8(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    std::size_t i = 0;
    while (i < input.size()) {
        const auto lead = static_cast<unsigned char>(input[i]);
        std::size_t length = 0;
        unsigned char low = 0x80;   // Allowed range of the second byte
        unsigned char high = 0xBF;

        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;   // overlong
            if (lead == 0xED) high = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;   // overlong
            if (lead == 0xF4) high = 0x8F;  // above U+10FFFF
        }

        bool valid = length > 0 && i + length <= input.size();
        for (std::size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(input[i + k]);
            valid = k == 1 ? (next >= low && next <= high) : (next >= 0x80 && next <= 0xBF);
        }

        if (valid) {
            result.append(input, i, length);
            i += length;
        } else {
            ++i;  // Skip invalid byte
        }
    }
    return result;
}

ContentDigest contentDigest(const std::string& title, const std::string& description) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Could not allocate digest context");
    }

    ContentDigest digest{};
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), title.data(), title.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), description.data(), description.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
        length != digest.size()) {
        throw std::runtime_error("SHA-256 computation failed");
    }
    return digest;
}

std::optional<Timestamp> extractPublishDate(const RawEntry& entry) {
    if (entry.pubDate) {
        if (auto date = Timestamp::parseRfc822(*entry.pubDate)) {
            return date;
        }
    }

    if (!entry.dublinCoreDates.empty()) {
        return Timestamp::parseIso8601(entry.dublinCoreDates.front());
    }

    return std::nullopt;
}

std::optional<std::string> extractImageUrl(const RawEntry& entry) {
    if (entry.thumbnailUrls.empty() || entry.thumbnailUrls.front().empty()) {
        return std::nullopt;
    }
    return entry.thumbnailUrls.front();
}

std::optional<std::filesystem::path> imagePathForUrl(const std::filesystem::path& cacheRoot,
                                                     const std::string& imageUrl) {
    std::string rest;
    if (hasPrefixNoCase(imageUrl, "https://")) {
        rest = imageUrl.substr(8);
    } else if (hasPrefixNoCase(imageUrl, "http://")) {
        rest = imageUrl.substr(7);
    } else {
        return std::nullopt;
    }

    rest = rest.substr(0, rest.find_first_of("?#"));
    if (rest.empty() || rest.back() == '/') {
        return std::nullopt;
    }

    std::filesystem::path relative;
    std::size_t segments = 0;
    std::istringstream parts(rest);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part.empty()) {
            continue;
        }
        if (part == "." || part == "..") {
            return std::nullopt;
        }
        relative /= part;
        ++segments;
    }

    // Host plus at least a file name
    if (segments < 2) {
        return std::nullopt;
    }
    return cacheRoot / relative;
}

NewsItem normalize(const RawEntry& entry, const std::filesystem::path& cacheRoot) {
    if (!entry.title) {
        throw MissingContentError("Entry has no title");
    }
    if (!entry.description) {
        throw MissingContentError("Entry \"" + *entry.title + "\" has no description");
    }

    NewsItem item;
    item.title = sanitizeUtf8(*entry.title);
    item.description = sanitizeUtf8(*entry.description);
    item.rawPublishDate = sanitized(entry.pubDate);
    item.publishDate = extractPublishDate(entry);
    item.digest = contentDigest(*item.title, *item.description);

    item.imageUrl = sanitized(extractImageUrl(entry));
    if (item.imageUrl) {
        item.imagePath = imagePathForUrl(cacheRoot, *item.imageUrl);
    }

    return item;
}

} // namespace core
} // namespace newsfeed
