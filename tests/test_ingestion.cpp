/**
 * Noos - Feed Ingestion Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "core/TimelineStore.hpp"
#include "feeds/Ingestion.hpp"

class IngestionTest : public ::testing::Test {
protected:
    void SetUp() override {
        feed.url = "https://example.com/rss";
        feed.title = "Example";
        feed.link = "https://example.com/";
        
        noos::FeedItem dated;
        dated.title = "Dated";
        dated.link = "https://example.com/1";
        dated.pubDate = "Tue, 14 Nov 2023 22:13:20 +0000";
        dated.publishedAt = 1700000000;
        feed.items.push_back(dated);
        
        noos::FeedItem undated;
        undated.title = "Undated";
        undated.pubDate = "not a date";
        feed.items.push_back(undated);
    }
    
    static constexpr std::int64_t INGESTED_AT = 1800000000;
    
    noos::ParsedFeed feed;
};

TEST_F(IngestionTest, CopiesItemAndChannelFields) {
    auto entry = noos::makeEntry(feed.items[0], feed, INGESTED_AT);
    
    EXPECT_EQ(entry.title, "Dated");
    EXPECT_FALSE(entry.description.has_value());
    EXPECT_EQ(entry.sourceName, "Example");
    EXPECT_EQ(entry.sourceLink, "https://example.com/");
    EXPECT_EQ(entry.link, "https://example.com/1");
    EXPECT_EQ(entry.timestamp, 1700000000);
    EXPECT_TRUE(entry.hasPublishedDate);
    EXPECT_EQ(entry.dateString(), "2023-11-14");
}

TEST_F(IngestionTest, PlacesUndatedItemsBeforeIngestion) {
    auto entry = noos::makeEntry(feed.items[1], feed, INGESTED_AT);
    
    EXPECT_EQ(entry.timestamp, INGESTED_AT - noos::MISSING_DATE_OFFSET.count());
    EXPECT_FALSE(entry.hasPublishedDate);
    EXPECT_EQ(entry.dateString(), "");
    EXPECT_EQ(entry.timeString(), "");
}

TEST_F(IngestionTest, UsesFeedUrlWhenChannelHasNoLink) {
    feed.link.clear();
    feed.title.reset();
    auto entry = noos::makeEntry(feed.items[0], feed, INGESTED_AT);
    
    EXPECT_EQ(entry.sourceLink, "https://example.com/rss");
    EXPECT_FALSE(entry.sourceName.has_value());
    EXPECT_EQ(entry.displaySource(), noos::NO_SOURCE_TEXT);
}

TEST_F(IngestionTest, AppendsEveryItemAndReportsFallbacks) {
    noos::TimelineStore store;
    auto report = noos::ingestFeed(store, feed, INGESTED_AT);
    
    EXPECT_EQ(report.appended, 2u);
    EXPECT_EQ(report.fallbackTimestamps, 1u);
    EXPECT_EQ(store.size(), 2u);
}

TEST_F(IngestionTest, EmptyFeedAppendsNothing) {
    noos::TimelineStore store;
    feed.items.clear();
    auto report = noos::ingestFeed(store, feed, INGESTED_AT);
    
    EXPECT_EQ(report.appended, 0u);
    EXPECT_TRUE(store.empty());
}
