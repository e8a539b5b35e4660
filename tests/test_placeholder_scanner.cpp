/**
 * Noos - Placeholder Scanner Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "render/PlaceholderScanner.hpp"

using noos::PlaceholderSpan;

TEST(PlaceholderScannerTest, BuildsLiteral) {
    EXPECT_EQ(noos::placeholderLiteral("title"), "${title}");
    EXPECT_EQ(noos::placeholderLiteral("channel_link"), "${channel_link}");
}

TEST(PlaceholderScannerTest, FindsSingleOccurrence) {
    auto spans = noos::findPlaceholder("<h1>${title}</h1>", "title");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], (PlaceholderSpan{4, 12}));
}

TEST(PlaceholderScannerTest, FindsRepeatedOccurrencesInOrder) {
    auto spans = noos::findPlaceholder("${date}-${date}", "date");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0], (PlaceholderSpan{0, 7}));
    EXPECT_EQ(spans[1], (PlaceholderSpan{8, 15}));
}

TEST(PlaceholderScannerTest, ReturnsEmptyWhenAbsent) {
    EXPECT_TRUE(noos::findPlaceholder("no placeholders here", "title").empty());
    EXPECT_TRUE(noos::findPlaceholder("", "title").empty());
}

TEST(PlaceholderScannerTest, MatchesCaseSensitively) {
    EXPECT_TRUE(noos::findPlaceholder("${Title} ${TITLE}", "title").empty());
}

TEST(PlaceholderScannerTest, RequiresExactDelimiters) {
    EXPECT_TRUE(noos::findPlaceholder("$title {title} ${title ${ title}", "title").empty());
}

TEST(PlaceholderScannerTest, DoesNotConfuseNamesSharingAPrefix) {
    const char* text = "${time} ${timestamp}";
    auto time = noos::findPlaceholder(text, "time");
    auto timestamp = noos::findPlaceholder(text, "timestamp");
    ASSERT_EQ(time.size(), 1u);
    ASSERT_EQ(timestamp.size(), 1u);
    EXPECT_EQ(time[0], (PlaceholderSpan{0, 7}));
    EXPECT_EQ(timestamp[0], (PlaceholderSpan{8, 20}));
}

TEST(PlaceholderScannerTest, SeparatesEscapedOccurrences) {
    auto scan = noos::scanPlaceholder("a \\${title} b ${title}", "title");
    ASSERT_EQ(scan.escapes.size(), 1u);
    EXPECT_EQ(scan.escapes[0], 2u);
    ASSERT_EQ(scan.live.size(), 1u);
    EXPECT_EQ(scan.live[0], (PlaceholderSpan{14, 22}));
}

TEST(PlaceholderScannerTest, EscapedAtStartOfText) {
    auto scan = noos::scanPlaceholder("\\${link}", "link");
    EXPECT_TRUE(scan.live.empty());
    ASSERT_EQ(scan.escapes.size(), 1u);
    EXPECT_EQ(scan.escapes[0], 0u);
}
