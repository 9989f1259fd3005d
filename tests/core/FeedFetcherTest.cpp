#include "core/FeedFetcher.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace newsfeed::core;
using newsfeed::testing::FakeHttpClient;

namespace {

std::string feedWithItems(const std::vector<std::string>& titles) {
    std::string xml = "<rss version=\"2.0\"><channel><title>Feed</title>";
    for (const auto& title : titles) {
        xml += "<item><title>" + title + "</title><description>" + title + " body</description></item>";
    }
    xml += "</channel></rss>";
    return xml;
}

bool hasTitle(const std::vector<RawEntry>& entries, const std::string& title) {
    return std::any_of(entries.begin(), entries.end(), [&](const RawEntry& entry) {
        return entry.title && *entry.title == title;
    });
}

} // namespace

TEST(FeedFetcherTest, CollectsEntriesFromEveryFeed) {
    FakeHttpClient client;
    client.respond("https://a.example.com/rss", feedWithItems({"A1", "A2"}));
    client.respond("https://b.example.com/rss", feedWithItems({"B1"}));

    WorkerPool pool(4);
    FeedFetcher fetcher(client, pool);
    FetchResult result = fetcher.fetchAll({
        FeedEndpoint("https://a.example.com/rss"),
        FeedEndpoint("https://b.example.com/rss")
    });

    EXPECT_EQ(result.feedsFetched, 2u);
    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(result.entries.size(), 3u);
    EXPECT_TRUE(hasTitle(result.entries, "A1"));
    EXPECT_TRUE(hasTitle(result.entries, "A2"));
    EXPECT_TRUE(hasTitle(result.entries, "B1"));
}

TEST(FeedFetcherTest, FailingFeedDoesNotAbortOthers) {
    FakeHttpClient client;
    client.respond("https://a.example.com/rss", feedWithItems({"A1"}));
    client.respond("https://c.example.com/rss", feedWithItems({"C1", "C2"}));
    // b.example.com answers 404

    WorkerPool pool(2);
    FeedFetcher fetcher(client, pool);
    FetchResult result = fetcher.fetchAll({
        FeedEndpoint("https://a.example.com/rss"),
        FeedEndpoint("https://b.example.com/rss", "Broken"),
        FeedEndpoint("https://c.example.com/rss")
    });

    EXPECT_EQ(result.feedsFetched, 2u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].url, "https://b.example.com/rss");
    EXPECT_FALSE(result.failures[0].reason.empty());
    EXPECT_EQ(result.entries.size(), 3u);
    EXPECT_FALSE(hasTitle(result.entries, "B1"));
}

TEST(FeedFetcherTest, UnparseableFeedIsAFailure) {
    FakeHttpClient client;
    client.respond("https://a.example.com/rss", "<html><body>Not a feed</body></html>");
    client.respond("https://b.example.com/rss", "<rss><channel>");

    WorkerPool pool(2);
    FeedFetcher fetcher(client, pool);
    FetchResult result = fetcher.fetchAll({
        FeedEndpoint("https://a.example.com/rss"),
        FeedEndpoint("https://b.example.com/rss")
    });

    EXPECT_EQ(result.feedsFetched, 0u);
    EXPECT_EQ(result.failures.size(), 2u);
    EXPECT_TRUE(result.entries.empty());
}

TEST(FeedFetcherTest, NoEndpointsNoRequests) {
    FakeHttpClient client;
    WorkerPool pool(1);
    FeedFetcher fetcher(client, pool);

    FetchResult result = fetcher.fetchAll({});
    EXPECT_EQ(result.feedsFetched, 0u);
    EXPECT_TRUE(result.entries.empty());
    EXPECT_EQ(client.totalRequests(), 0);
}

TEST(FeedFetcherTest, FetchOneThrowsForFailedFeed) {
    FakeHttpClient client;
    WorkerPool pool(1);
    FeedFetcher fetcher(client, pool);
    EXPECT_THROW(fetcher.fetchOne(FeedEndpoint("https://missing.example.com/rss")), FeedFetchError);
}
