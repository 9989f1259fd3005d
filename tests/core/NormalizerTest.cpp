#include "core/Errors.hpp"
#include "core/Normalizer.hpp"
#include <gtest/gtest.h>

using namespace newsfeed::core;

namespace {

RawEntry makeEntry(const std::string& title, const std::string& description) {
    RawEntry entry;
    entry.title = title;
    entry.description = description;
    return entry;
}

} // namespace

TEST(NormalizerTest, DigestIsSha256OfTitleThenDescription) {
    EXPECT_EQ(digestToHex(contentDigest("", "")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(digestToHex(contentDigest("ab", "c")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_NE(contentDigest("Title", "Body"), contentDigest("Body", "Title"));
}

TEST(NormalizerTest, PrefersNativePublishDate) {
    RawEntry entry = makeEntry("T", "D");
    entry.pubDate = "Tue, 02 Jan 2024 10:00:00 +0000";
    entry.dublinCoreDates = {"2023-05-01T08:00:00+00:00"};

    auto date = extractPublishDate(entry);
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->toIso8601(), "2024-01-02T10:00:00+00:00");
}

TEST(NormalizerTest, FallsBackToFirstDublinCoreDate) {
    RawEntry entry = makeEntry("T", "D");
    entry.dublinCoreDates = {"2023-05-01T08:00:00+00:00", "2020-01-01T00:00:00Z"};

    auto date = extractPublishDate(entry);
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->toIso8601(), "2023-05-01T08:00:00+00:00");

    entry.pubDate = "sometime last week";
    date = extractPublishDate(entry);
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->toIso8601(), "2023-05-01T08:00:00+00:00");
}

TEST(NormalizerTest, NoPublishDateWhenNothingParses) {
    RawEntry entry = makeEntry("T", "D");
    EXPECT_FALSE(extractPublishDate(entry).has_value());

    entry.dublinCoreDates = {"May 1st"};
    EXPECT_FALSE(extractPublishDate(entry).has_value());
}

TEST(NormalizerTest, ImageUrlComesFromFirstThumbnail) {
    RawEntry entry = makeEntry("T", "D");
    EXPECT_FALSE(extractImageUrl(entry).has_value());

    entry.thumbnailUrls = {"https://example.com/one.jpg", "https://example.com/two.jpg"};
    EXPECT_EQ(extractImageUrl(entry), std::optional<std::string>("https://example.com/one.jpg"));

    entry.thumbnailUrls = {"", "https://example.com/two.jpg"};
    EXPECT_FALSE(extractImageUrl(entry).has_value());
}

TEST(NormalizerTest, ImagePathMirrorsUrlUnderCacheRoot) {
    auto path = imagePathForUrl("/cache", "https://example.com/img/a.jpg");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, std::filesystem::path("/cache/example.com/img/a.jpg"));

    path = imagePathForUrl("/cache", "http://cdn.example.org/x/y/z.png?w=300#top");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, std::filesystem::path("/cache/cdn.example.org/x/y/z.png"));

    path = imagePathForUrl("/cache", "HTTPS://example.com//double//slash.gif");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, std::filesystem::path("/cache/example.com/double/slash.gif"));
}

TEST(NormalizerTest, ImagePathRejectsUnsafeOrIncompleteUrls) {
    EXPECT_FALSE(imagePathForUrl("/cache", "ftp://example.com/a.jpg").has_value());
    EXPECT_FALSE(imagePathForUrl("/cache", "example.com/a.jpg").has_value());
    EXPECT_FALSE(imagePathForUrl("/cache", "https://example.com").has_value());
    EXPECT_FALSE(imagePathForUrl("/cache", "https://example.com/img/").has_value());
    EXPECT_FALSE(imagePathForUrl("/cache", "https://example.com/../../etc/passwd").has_value());
    EXPECT_FALSE(imagePathForUrl("/cache", "https://example.com/./a.jpg").has_value());
}

TEST(NormalizerTest, NormalizeBuildsCanonicalItem) {
    RawEntry entry = makeEntry("Kernel released", "Lots of changes");
    entry.pubDate = "Tue, 02 Jan 2024 10:00:00 +0000";
    entry.thumbnailUrls = {"https://example.com/img/a.jpg"};

    NewsItem item = normalize(entry, "/cache");
    EXPECT_EQ(item.title, std::optional<std::string>("Kernel released"));
    EXPECT_EQ(item.description, std::optional<std::string>("Lots of changes"));
    EXPECT_EQ(item.rawPublishDate, std::optional<std::string>("Tue, 02 Jan 2024 10:00:00 +0000"));
    ASSERT_TRUE(item.publishDate.has_value());
    EXPECT_EQ(item.publishDate->toIso8601(), "2024-01-02T10:00:00+00:00");
    EXPECT_EQ(item.imageUrl, std::optional<std::string>("https://example.com/img/a.jpg"));
    ASSERT_TRUE(item.imagePath.has_value());
    EXPECT_EQ(*item.imagePath, std::filesystem::path("/cache/example.com/img/a.jpg"));
    EXPECT_EQ(item.digest, contentDigest("Kernel released", "Lots of changes"));
    EXPECT_EQ(item.toString(), "Kernel released - Lots of changes");
}

TEST(NormalizerTest, NormalizeWithoutOptionalParts) {
    NewsItem item = normalize(makeEntry("", ""), "/cache");
    EXPECT_EQ(item.title, std::optional<std::string>(""));
    EXPECT_FALSE(item.rawPublishDate.has_value());
    EXPECT_FALSE(item.publishDate.has_value());
    EXPECT_FALSE(item.imageUrl.has_value());
    EXPECT_FALSE(item.imagePath.has_value());
}

TEST(NormalizerTest, UnmappableImageKeepsUrlWithoutPath) {
    RawEntry entry = makeEntry("T", "D");
    entry.thumbnailUrls = {"data:image/png;base64,AAAA"};

    NewsItem item = normalize(entry, "/cache");
    EXPECT_TRUE(item.imageUrl.has_value());
    EXPECT_FALSE(item.imagePath.has_value());
}

TEST(NormalizerTest, MissingTitleOrDescriptionIsRejected) {
    RawEntry noTitle;
    noTitle.description = "D";
    EXPECT_THROW(normalize(noTitle, "/cache"), MissingContentError);

    RawEntry noDescription;
    noDescription.title = "T";
    EXPECT_THROW(normalize(noDescription, "/cache"), MissingContentError);
}

TEST(NormalizerTest, SanitizesInvalidUtf8) {
    EXPECT_EQ(sanitizeUtf8("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitizeUtf8("a\xFF" "b"), "ab");
    EXPECT_EQ(sanitizeUtf8("\xC0\xAF"), "");
    EXPECT_EQ(sanitizeUtf8("\xED\xA0\x80x"), "x");
    EXPECT_EQ(sanitizeUtf8("\xF0\x9F\x98\x80"), "\xF0\x9F\x98\x80");

    NewsItem item = normalize(makeEntry("bad\xFE", "text\xC3"), "/cache");
    EXPECT_EQ(item.title, std::optional<std::string>("bad"));
    EXPECT_EQ(item.description, std::optional<std::string>("text"));
    EXPECT_EQ(item.digest, contentDigest("bad", "text"));
}
