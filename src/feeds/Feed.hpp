/**
 * Noos - Feed Data
 * 
 * Content of one fetched RSS/Atom feed, before it enters the timeline.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace noos {

/**
 * One item of a feed
 * 
 * Fields are std::nullopt when the element was absent from the feed.
 */
struct FeedItem {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> link;
    std::optional<std::string> pubDate;         // Raw date text
    std::optional<std::int64_t> publishedAt;    // pubDate parsed, seconds since epoch
};

/**
 * A parsed feed (RSS channel or Atom feed)
 */
struct ParsedFeed {
    std::string url;                        // Where the feed was fetched from
    std::optional<std::string> title;
    std::string link;                       // Channel website, may be empty
    std::vector<FeedItem> items;
    
    /**
     * Canonical link of the channel, falling back to the feed URL
     */
    std::string sourceLink() const {
        return link.empty() ? url : link;
    }
};

} // namespace noos
