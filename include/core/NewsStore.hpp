#pragma once

#include "core/NewsItem.hpp"
#include <filesystem>
#include <vector>

namespace newsfeed {
namespace core {

struct MergeResult {
    std::vector<NewsItem> items;  // Newest first
    std::size_t added = 0;        // Items not present before the merge
};

// Drop items identity-equal to an earlier one. The first occurrence wins and
// survivors keep their relative order.
std::vector<NewsItem> deduplicate(std::vector<NewsItem> items);

// Stable sorts. Oldest first puts undated items at the front; newest first
// puts them at the back. Equal dates keep their existing order.
void sortOldestFirst(std::vector<NewsItem>& items);
void sortNewestFirst(std::vector<NewsItem>& items);

// The durable item collection: one JSON file rewritten wholesale on every
// merge. The caller must not run two merges against the same file at once.
class NewsStore {
public:
    explicit NewsStore(const std::filesystem::path& storeFile);

    // Items in stored order. A missing file is an empty store; anything
    // unreadable or malformed throws StoreError.
    std::vector<NewsItem> load() const;

    // Replace the stored collection. Writes a temporary file and renames it
    // over the store, so a failure leaves the previous contents intact.
    // Throws StoreError.
    void persist(const std::vector<NewsItem>& items) const;

    // Append fresh items to the stored ones, deduplicate, persist oldest
    // first and return newest first.
    MergeResult merge(const std::vector<NewsItem>& fresh) const;

    // Same, against an already loaded collection.
    MergeResult merge(std::vector<NewsItem> existing, const std::vector<NewsItem>& fresh) const;

    const std::filesystem::path& path() const { return storeFile_; }

    static constexpr int kFormatVersion = 1;

private:
    std::filesystem::path storeFile_;
};

} // namespace core
} // namespace newsfeed
