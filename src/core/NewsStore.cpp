#include "core/NewsStore.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <fstream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <nlohmann/json.hpp>

namespace newsfeed {
namespace core {

namespace {

// Ordered key with the same equality as sameItem().
using IdentityKey = std::tuple<std::optional<std::string>,
                               std::optional<std::string>,
                               std::optional<std::string>>;

IdentityKey identityKey(const NewsItem& item) {
    return IdentityKey(item.title, item.description, item.rawPublishDate);
}

} // namespace

std::vector<NewsItem> deduplicate(std::vector<NewsItem> items) {
    std::set<IdentityKey> seen;
    std::vector<NewsItem> unique;
    unique.reserve(items.size());

    for (auto& item : items) {
        if (seen.insert(identityKey(item)).second) {
            unique.push_back(std::move(item));
        }
    }
    return unique;
}

void sortOldestFirst(std::vector<NewsItem>& items) {
    std::stable_sort(items.begin(), items.end(), publishedBefore);
}

void sortNewestFirst(std::vector<NewsItem>& items) {
    std::stable_sort(items.begin(), items.end(), [](const NewsItem& a, const NewsItem& b) {
        return publishedBefore(b, a);
    });
}

NewsStore::NewsStore(const std::filesystem::path& storeFile)
    : storeFile_(storeFile) {}

std::vector<NewsItem> NewsStore::load() const {
    std::error_code ec;
    const bool present = std::filesystem::exists(storeFile_, ec);
    if (ec) {
        throw StoreError("Could not inspect item store " + storeFile_.string() + ": " + ec.message());
    }
    if (!present) {
        return {};
    }

    std::ifstream file(storeFile_);
    if (!file.is_open()) {
        throw StoreError("Could not open item store: " + storeFile_.string());
    }

    std::vector<NewsItem> items;
    try {
        nlohmann::json j = nlohmann::json::parse(file);

        if (!j.is_object()) {
            throw StoreError("Corrupt item store " + storeFile_.string() + ": not a JSON object");
        }
        const int version = j.at("version").get<int>();
        if (version != kFormatVersion) {
            throw StoreError("Unsupported item store version " + std::to_string(version) +
                             " in " + storeFile_.string());
        }

        const auto& entries = j.at("items");
        if (!entries.is_array()) {
            throw StoreError("Corrupt item store " + storeFile_.string() + ": \"items\" is not an array");
        }

        items.reserve(entries.size());
        for (const auto& entry : entries) {
            items.push_back(NewsItem::fromJson(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("Corrupt item store " + storeFile_.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw StoreError("Corrupt item store " + storeFile_.string() + ": " + e.what());
    }

    return items;
}

void NewsStore::persist(const std::vector<NewsItem>& items) const {
    std::string serialized;
    try {
        nlohmann::json j;
        j["version"] = kFormatVersion;
        j["items"] = nlohmann::json::array();
        for (const auto& item : items) {
            j["items"].push_back(item.toJson());
        }
        serialized = j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("Could not serialize item store: " + std::string(e.what()));
    }

    std::error_code ec;
    if (storeFile_.has_parent_path()) {
        std::filesystem::create_directories(storeFile_.parent_path(), ec);
        if (ec) {
            throw StoreError("Could not create " + storeFile_.parent_path().string() + ": " + ec.message());
        }
    }

    std::filesystem::path temporary = storeFile_;
    temporary += ".tmp";

    {
        std::ofstream file(temporary, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw StoreError("Could not open " + temporary.string() + " for writing");
        }
        file << serialized;
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temporary, ec);
            throw StoreError("Could not write item store to " + temporary.string());
        }
    }

    std::filesystem::rename(temporary, storeFile_, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(temporary, ec);
        throw StoreError("Could not replace item store " + storeFile_.string() + ": " + reason);
    }
}

MergeResult NewsStore::merge(const std::vector<NewsItem>& fresh) const {
    return merge(load(), fresh);
}

MergeResult NewsStore::merge(std::vector<NewsItem> existing, const std::vector<NewsItem>& fresh) const {
    std::vector<NewsItem> combined = deduplicate(std::move(existing));
    const std::size_t before = combined.size();

    combined.insert(combined.end(), fresh.begin(), fresh.end());
    combined = deduplicate(std::move(combined));

    MergeResult result;
    result.added = combined.size() - before;

    sortOldestFirst(combined);
    persist(combined);

    sortNewestFirst(combined);
    result.items = std::move(combined);
    return result;
}

} // namespace core
} // namespace newsfeed
