/**
 * Noos - Feed Parser Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <QString>

#include "network/FeedParser.hpp"

class FeedParserTest : public ::testing::Test {
protected:
    const QString rssFeed = QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<rss version=\"2.0\"><channel>"
        "<title>Example</title>"
        "<link>https://example.com/</link>"
        "<description>Channel</description>"
        "<item>"
        "<title>First</title>"
        "<link>https://example.com/1</link>"
        "<description>&lt;p&gt;Body&lt;/p&gt;</description>"
        "<pubDate>Tue, 14 Nov 2023 22:13:20 +0000</pubDate>"
        "</item>"
        "<item>"
        "<title></title>"
        "<link>https://example.com/2</link>"
        "</item>"
        "<item>"
        "<title>Third</title>"
        "<pubDate>sometime last week</pubDate>"
        "</item>"
        "</channel></rss>");
    
    const QString atomFeed = QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<feed xmlns=\"http://www.w3.org/2005/Atom\">"
        "<title>Atom Example</title>"
        "<link rel=\"self\" href=\"https://example.org/feed.xml\"/>"
        "<link href=\"https://example.org/\"/>"
        "<entry>"
        "<title>Entry</title>"
        "<link rel=\"alternate\" href=\"https://example.org/e1\"/>"
        "<summary>Sum</summary>"
        "<content>Full</content>"
        "<updated>2023-11-15T00:00:00Z</updated>"
        "<published>2023-11-14T22:13:20Z</published>"
        "</entry>"
        "</feed>");
};

TEST_F(FeedParserTest, ParsesRssChannel) {
    auto feed = noos::parseFeed(rssFeed, "https://example.com/rss");
    ASSERT_TRUE(feed.has_value());
    
    EXPECT_EQ(feed->url, "https://example.com/rss");
    EXPECT_EQ(feed->title, "Example");
    EXPECT_EQ(feed->link, "https://example.com/");
    EXPECT_EQ(feed->sourceLink(), "https://example.com/");
    ASSERT_EQ(feed->items.size(), 3u);
}

TEST_F(FeedParserTest, ParsesRssItems) {
    auto feed = noos::parseFeed(rssFeed, "https://example.com/rss");
    ASSERT_TRUE(feed.has_value());
    ASSERT_EQ(feed->items.size(), 3u);
    
    const auto& first = feed->items[0];
    EXPECT_EQ(first.title, "First");
    EXPECT_EQ(first.link, "https://example.com/1");
    EXPECT_EQ(first.description, "<p>Body</p>");
    EXPECT_EQ(first.publishedAt, 1700000000);
}

TEST_F(FeedParserTest, DistinguishesEmptyFromMissingElements) {
    auto feed = noos::parseFeed(rssFeed, "https://example.com/rss");
    ASSERT_TRUE(feed.has_value());
    ASSERT_EQ(feed->items.size(), 3u);
    
    const auto& second = feed->items[1];
    ASSERT_TRUE(second.title.has_value());
    EXPECT_EQ(*second.title, "");
    EXPECT_FALSE(second.description.has_value());
    EXPECT_FALSE(second.pubDate.has_value());
    EXPECT_FALSE(second.publishedAt.has_value());
}

TEST_F(FeedParserTest, KeepsUnparseableDateText) {
    auto feed = noos::parseFeed(rssFeed, "https://example.com/rss");
    ASSERT_TRUE(feed.has_value());
    ASSERT_EQ(feed->items.size(), 3u);
    
    const auto& third = feed->items[2];
    EXPECT_EQ(third.pubDate, "sometime last week");
    EXPECT_FALSE(third.publishedAt.has_value());
    EXPECT_FALSE(third.link.has_value());
}

TEST_F(FeedParserTest, ParsesAtomFeed) {
    auto feed = noos::parseFeed(atomFeed, "https://example.org/feed.xml");
    ASSERT_TRUE(feed.has_value());
    
    EXPECT_EQ(feed->title, "Atom Example");
    EXPECT_EQ(feed->link, "https://example.org/");
    ASSERT_EQ(feed->items.size(), 1u);
    
    const auto& entry = feed->items[0];
    EXPECT_EQ(entry.title, "Entry");
    EXPECT_EQ(entry.link, "https://example.org/e1");
    EXPECT_EQ(entry.description, "Sum");
    EXPECT_EQ(entry.publishedAt, 1700000000);
}

TEST_F(FeedParserTest, LimitsItemCount) {
    auto feed = noos::parseFeed(rssFeed, "https://example.com/rss", 2);
    ASSERT_TRUE(feed.has_value());
    EXPECT_EQ(feed->items.size(), 2u);
}

TEST_F(FeedParserTest, RejectsMalformedXml) {
    auto feed = noos::parseFeed("<rss><channel><item><title>x</channel></rss>", "bad");
    EXPECT_FALSE(feed.has_value());
}

TEST_F(FeedParserTest, SourceLinkFallsBackToFeedUrl) {
    auto feed = noos::parseFeed("<rss><channel><title>t</title></channel></rss>",
                                "https://example.net/feed");
    ASSERT_TRUE(feed.has_value());
    EXPECT_TRUE(feed->link.empty());
    EXPECT_EQ(feed->sourceLink(), "https://example.net/feed");
}

TEST_F(FeedParserTest, IgnoresExtensionElements) {
    auto feed = noos::parseFeed(QStringLiteral(
        "<rss version=\"2.0\""
        " xmlns:itunes=\"http://www.itunes.com/dtds/podcast-1.0.dtd\""
        " xmlns:media=\"http://search.yahoo.com/mrss/\">"
        "<channel>"
        "<itunes:title>Podcast Alias</itunes:title>"
        "<title>Podcast</title>"
        "<item>"
        "<title></title>"
        "<itunes:title>Episode Alias</itunes:title>"
        "<itunes:summary>Long summary</itunes:summary>"
        "<media:group><media:title>Media</media:title>"
        "<media:description>Media text</media:description></media:group>"
        "</item>"
        "</channel></rss>"), "https://pod.example/rss");
    
    ASSERT_TRUE(feed.has_value());
    EXPECT_EQ(feed->title, "Podcast");
    ASSERT_EQ(feed->items.size(), 1u);
    
    const auto& item = feed->items[0];
    ASSERT_TRUE(item.title.has_value());
    EXPECT_EQ(*item.title, "");
    EXPECT_FALSE(item.description.has_value());
}

TEST_F(FeedParserTest, ReadsRss1Items) {
    auto feed = noos::parseFeed(QStringLiteral(
        "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\""
        " xmlns=\"http://purl.org/rss/1.0/\">"
        "<channel><title>RDF</title><link>https://rdf.example/</link></channel>"
        "<item><title>One</title><link>https://rdf.example/1</link></item>"
        "</rdf:RDF>"), "https://rdf.example/rss");
    
    ASSERT_TRUE(feed.has_value());
    EXPECT_EQ(feed->title, "RDF");
    ASSERT_EQ(feed->items.size(), 1u);
    EXPECT_EQ(feed->items[0].title, "One");
}

TEST(PublishedDateTest, ParsesRfc2822AndIso8601) {
    EXPECT_EQ(noos::parsePublishedDate("Tue, 14 Nov 2023 22:13:20 +0000"), 1700000000);
    EXPECT_EQ(noos::parsePublishedDate("2023-11-14T22:13:20Z"), 1700000000);
    EXPECT_EQ(noos::parsePublishedDate("2023-11-14T23:13:20+01:00"), 1700000000);
    EXPECT_EQ(noos::parsePublishedDate("  2023-11-14T22:13:20Z\n"), 1700000000);
}

TEST(PublishedDateTest, RejectsGarbage) {
    EXPECT_FALSE(noos::parsePublishedDate("yesterday").has_value());
    EXPECT_FALSE(noos::parsePublishedDate("").has_value());
}
