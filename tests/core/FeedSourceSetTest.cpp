#include "core/Errors.hpp"
#include "core/FeedSourceSet.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace newsfeed::core;
using newsfeed::testing::TempDir;

TEST(FeedSourceSetTest, SeedsDefaultFeedsOnFirstStart) {
    TempDir dir;
    const auto file = dir.path() / "config" / "feeds.json";

    FeedSourceSet sources(file);
    EXPECT_EQ(sources.size(), FeedSourceSet::defaultFeeds().size());
    EXPECT_EQ(sources.size(), 6u);
    EXPECT_TRUE(std::filesystem::exists(file));

    FeedSourceSet reloaded(file);
    EXPECT_EQ(reloaded.size(), 6u);
    EXPECT_EQ(reloaded.getFeeds()[0].url, "http://feeds.arstechnica.com/arstechnica/index");
}

TEST(FeedSourceSetTest, ValidatesAndNormalizesUrls) {
    EXPECT_EQ(FeedSourceSet::cleanAndValidateUrl("  https://Example.COM/feed \n"), "https://example.com/feed");
    EXPECT_EQ(FeedSourceSet::cleanAndValidateUrl("http://example.com"), "http://example.com/");
    EXPECT_EQ(FeedSourceSet::cleanAndValidateUrl(""), "");
    EXPECT_EQ(FeedSourceSet::cleanAndValidateUrl("   "), "");
    EXPECT_EQ(FeedSourceSet::cleanAndValidateUrl("not a url"), "");
    EXPECT_EQ(FeedSourceSet::cleanAndValidateUrl("ftp://example.com/feed"), "");
    EXPECT_EQ(FeedSourceSet::cleanAndValidateUrl("file:///etc/passwd"), "");
}

TEST(FeedSourceSetTest, AddPersistsAndRejectsDuplicates) {
    TempDir dir;
    const auto file = dir.path() / "feeds.json";
    FeedSourceSet sources(file);
    const std::size_t seeded = sources.size();

    EXPECT_TRUE(sources.addFeed("https://news.example.com/rss", "Example"));
    EXPECT_FALSE(sources.addFeed("https://news.example.com/rss"));
    EXPECT_FALSE(sources.addFeed("https://other.example.com/rss", "Example"));
    EXPECT_FALSE(sources.addFeed("gopher://news.example.com/"));
    EXPECT_EQ(sources.size(), seeded + 1);

    FeedSourceSet reloaded(file);
    ASSERT_EQ(reloaded.size(), seeded + 1);
    EXPECT_EQ(reloaded.getFeeds().back().name, "Example");
    EXPECT_TRUE(reloaded.getFeeds().back().enabled);
}

TEST(FeedSourceSetTest, RemoveAndToggleByUrlOrName) {
    TempDir dir;
    const auto file = dir.path() / "feeds.json";
    newsfeed::testing::writeFile(file, R"({"feeds": [
        {"url": "https://a.example.com/rss", "name": "A"},
        {"url": "https://b.example.com/rss", "name": "B", "enabled": true},
        {"url": "https://c.example.com/rss"}
    ]})");

    FeedSourceSet sources(file);
    ASSERT_EQ(sources.size(), 3u);

    EXPECT_TRUE(sources.setEnabled("B", false));
    EXPECT_TRUE(sources.setEnabled("https://c.example.com/rss", false));
    EXPECT_FALSE(sources.setEnabled("nope", false));
    ASSERT_EQ(sources.enabledFeeds().size(), 1u);
    EXPECT_EQ(sources.enabledFeeds()[0].name, "A");

    EXPECT_TRUE(sources.removeFeed("https://a.example.com/rss"));
    EXPECT_FALSE(sources.removeFeed("A"));
    EXPECT_FALSE(sources.removeFeed(""));

    FeedSourceSet reloaded(file);
    ASSERT_EQ(reloaded.size(), 2u);
    EXPECT_TRUE(reloaded.enabledFeeds().empty());
    EXPECT_EQ(reloaded.getFeeds()[1].label(), "https://c.example.com/rss");
}

TEST(FeedSourceSetTest, SkipsInvalidStoredUrls) {
    TempDir dir;
    const auto file = dir.path() / "feeds.json";
    newsfeed::testing::writeFile(file, R"({"feeds": [
        {"url": "https://a.example.com/rss"},
        {"url": "mailto:someone@example.com"}
    ]})");

    FeedSourceSet sources(file);
    EXPECT_EQ(sources.size(), 1u);
}

TEST(FeedSourceSetTest, MalformedFileIsConfigurationError) {
    TempDir dir;
    const auto file = dir.path() / "feeds.json";

    newsfeed::testing::writeFile(file, "feeds: [a, b]");
    EXPECT_THROW(FeedSourceSet sources(file), ConfigurationError);

    newsfeed::testing::writeFile(file, R"({"feeds": "https://a.example.com/rss"})");
    EXPECT_THROW(FeedSourceSet sources(file), ConfigurationError);

    newsfeed::testing::writeFile(file, R"({"feeds": [{"name": "no url"}]})");
    EXPECT_THROW(FeedSourceSet sources(file), ConfigurationError);
}

TEST(FeedSourceSetTest, EndpointJsonDefaults) {
    FeedEndpoint endpoint = FeedEndpoint::fromJson(nlohmann::json{{"url", "https://a.example.com/rss"}});
    EXPECT_EQ(endpoint.name, "");
    EXPECT_TRUE(endpoint.enabled);
    EXPECT_EQ(endpoint.label(), "https://a.example.com/rss");

    FeedEndpoint copy = FeedEndpoint::fromJson(FeedEndpoint("https://a.example.com/rss", "A", false).toJson());
    EXPECT_EQ(copy.name, "A");
    EXPECT_FALSE(copy.enabled);
    EXPECT_EQ(copy, endpoint);
}

TEST(FeedSourceSetTest, TrailingGarbageIsConfigurationError) {
    TempDir dir;
    const auto file = dir.path() / "feeds.json";
    newsfeed::testing::writeFile(file, R"({"feeds": []} trailing)");
    EXPECT_THROW(FeedSourceSet sources(file), ConfigurationError);
}

TEST(FeedSourceSetTest, MatchesUrlsAsTheyWereTyped) {
    TempDir dir;
    FeedSourceSet sources(dir.path() / "feeds.json");
    const std::size_t seeded = sources.size();

    ASSERT_TRUE(sources.addFeed("https://Example.com/feed"));
    EXPECT_TRUE(sources.setEnabled("https://Example.com/feed", false));
    EXPECT_TRUE(sources.setEnabled("  https://EXAMPLE.com/feed ", true));
    EXPECT_TRUE(sources.removeFeed("https://Example.com/feed"));
    EXPECT_EQ(sources.size(), seeded);
}
