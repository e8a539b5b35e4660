/**
 * Noos - Item Template Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "render/ItemTemplate.hpp"

using noos::Entry;
using noos::ItemPlaceholder;
using noos::ItemTemplate;

class ItemTemplateTest : public ::testing::Test {
protected:
    static Entry sampleEntry() {
        Entry entry;
        entry.title = "A & B";
        entry.description = "<p>x</p>";
        entry.sourceName = "Feed";
        entry.sourceLink = "https://feed.example";
        entry.link = "https://feed.example/a?x=1&y=2";
        entry.timestamp = 1700000000;   // 2023-11-14 22:13:20 UTC
        return entry;
    }
    
    const char* allPlaceholders =
        "${title}|${description}|${source}|${link}|${date}|${time}|${timestamp}|${channel_link}";
};

TEST_F(ItemTemplateTest, SubstitutesAllPlaceholders) {
    ItemTemplate tmpl(allPlaceholders);
    EXPECT_EQ(tmpl.render(sampleEntry()),
              "A &amp; B|&lt;p&gt;x&lt;/p&gt;|Feed|https://feed.example/a?x=1&amp;y=2|"
              "2023-11-14|22:13:20|1700000000|https://feed.example");
}

TEST_F(ItemTemplateTest, RecordsOccurrencesInOrder) {
    ItemTemplate tmpl("${link} ${title} ${link}");
    ASSERT_EQ(tmpl.occurrences().size(), 3u);
    EXPECT_EQ(tmpl.occurrences()[0].kind, ItemPlaceholder::Link);
    EXPECT_EQ(tmpl.occurrences()[1].kind, ItemPlaceholder::Title);
    EXPECT_EQ(tmpl.occurrences()[2].kind, ItemPlaceholder::Link);
    EXPECT_EQ(tmpl.count(ItemPlaceholder::Link), 2u);
    EXPECT_TRUE(tmpl.contains(ItemPlaceholder::Title));
    EXPECT_FALSE(tmpl.contains(ItemPlaceholder::Description));
}

TEST_F(ItemTemplateTest, UsesDefaultTextForAbsentFields) {
    ItemTemplate tmpl(allPlaceholders);
    Entry entry;
    entry.sourceLink = "https://feed.example";
    entry.timestamp = 1700000000;
    entry.hasPublishedDate = false;
    
    EXPECT_EQ(tmpl.render(entry),
              "(No title)|(No description)|(No source)||||1700000000|https://feed.example");
}

TEST_F(ItemTemplateTest, RendersEmptyFieldsAsEmpty) {
    ItemTemplate tmpl("[${title}][${description}][${source}]");
    Entry entry;
    entry.title = "";
    entry.description = "";
    entry.sourceName = "";
    
    EXPECT_EQ(tmpl.render(entry), "[][][]");
}

TEST_F(ItemTemplateTest, PredictsExactOutputSize) {
    const char* templates[] = {
        "",
        "static text",
        "${title}",
        "<a href=\"${link}\">${title}</a> ${title}",
        "\\${title} ${description} \\${source}",
    };
    
    Entry absent;
    absent.hasPublishedDate = false;
    Entry entries[] = {sampleEntry(), absent};
    
    for (const char* text : templates) {
        ItemTemplate tmpl(text);
        for (const auto& entry : entries) {
            auto values = tmpl.resolve(entry);
            EXPECT_EQ(tmpl.predictSize(values), tmpl.assemble(values).size()) << text;
        }
    }
}

TEST_F(ItemTemplateTest, OutputIsDeterministic) {
    ItemTemplate tmpl(allPlaceholders);
    Entry entry = sampleEntry();
    EXPECT_EQ(tmpl.render(entry), tmpl.render(entry));
}

TEST_F(ItemTemplateTest, TemplateWithoutPlaceholdersIsReturnedAsIs) {
    ItemTemplate tmpl("<hr>");
    EXPECT_TRUE(tmpl.occurrences().empty());
    EXPECT_EQ(tmpl.render(sampleEntry()), "<hr>");
}

TEST_F(ItemTemplateTest, EscapedPlaceholderIsEmittedLiterally) {
    ItemTemplate tmpl("\\${title} = ${title}");
    EXPECT_EQ(tmpl.escapes().size(), 1u);
    EXPECT_EQ(tmpl.count(ItemPlaceholder::Title), 1u);
    EXPECT_EQ(tmpl.render(sampleEntry()), "${title} = A &amp; B");
}

TEST_F(ItemTemplateTest, EscapeOnlyAppliesDirectlyBeforePlaceholder) {
    ItemTemplate tmpl("C:\\path \\\\${title}");
    EXPECT_EQ(tmpl.render(sampleEntry()), "C:\\path \\${title}");
}

TEST_F(ItemTemplateTest, UnknownNamesAreLeftUntouched) {
    ItemTemplate tmpl("${author} \\${author} ${items} ${title}");
    EXPECT_EQ(tmpl.render(sampleEntry()), "${author} \\${author} ${items} A &amp; B");
}

TEST_F(ItemTemplateTest, DoesNotRescanSubstitutedValues) {
    ItemTemplate tmpl("${title}");
    Entry entry;
    entry.title = "${description}";
    EXPECT_EQ(tmpl.render(entry), "${description}");
}
