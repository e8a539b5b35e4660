/**
 * Noos - HTML Escaping Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "render/HtmlEscape.hpp"

TEST(HtmlEscapeTest, EscapesSpecialCharacters) {
    EXPECT_EQ(noos::escapeHtml("<script>"), "&lt;script&gt;");
    EXPECT_EQ(noos::escapeHtml("Tom & Jerry"), "Tom &amp; Jerry");
    EXPECT_EQ(noos::escapeHtml("say \"hi\""), "say &quot;hi&quot;");
    EXPECT_EQ(noos::escapeHtml("it's"), "it&#39;s");
}

TEST(HtmlEscapeTest, LeavesPlainTextUnchanged) {
    EXPECT_EQ(noos::escapeHtml("plain text 123"), "plain text 123");
    EXPECT_EQ(noos::escapeHtml(""), "");
}

TEST(HtmlEscapeTest, DoesNotDoubleDecodeEntities) {
    EXPECT_EQ(noos::escapeHtml("&amp;"), "&amp;amp;");
}

TEST(HtmlEscapeTest, PassesUtf8Through) {
    EXPECT_EQ(noos::escapeHtml("caf\xC3\xA9 <b>"), "caf\xC3\xA9 &lt;b&gt;");
}

TEST(HtmlEscapeTest, PredictsEscapedLength) {
    const char* samples[] = {"", "abc", "<a href=\"x\">&'</a>", "\xE2\x82\xAC & more"};
    for (const char* sample : samples) {
        EXPECT_EQ(noos::escapedHtmlLength(sample), noos::escapeHtml(sample).size()) << sample;
    }
}
