/**
 * Noos - Timeline Entry
 * 
 * A single article-sized unit of renderable data.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace noos {

/**
 * Display text used when the feed did not provide a field at all
 */
constexpr const char* NO_TITLE_TEXT = "(No title)";
constexpr const char* NO_DESCRIPTION_TEXT = "(No description)";
constexpr const char* NO_SOURCE_TEXT = "(No source)";

/**
 * One entry of the timeline
 * 
 * Optional fields are std::nullopt when the source did not carry them.
 * An empty string means the source carried the field with no content,
 * which renders as empty instead of the default text.
 */
struct Entry {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> sourceName;   // Channel title
    std::string sourceLink;                  // Canonical channel URL
    std::optional<std::string> link;         // Article URL
    std::int64_t timestamp = 0;              // Seconds since epoch
    bool hasPublishedDate = true;            // False if timestamp is a fallback
    
    /**
     * Title, or "(No title)" if absent
     */
    std::string displayTitle() const;
    
    /**
     * Description, or "(No description)" if absent
     */
    std::string displayDescription() const;
    
    /**
     * Channel title, or "(No source)" if absent
     */
    std::string displaySource() const;
    
    std::string displayLink() const;
    
    /**
     * Publish date as YYYY-MM-DD (UTC)
     * 
     * Empty when the publish date could not be parsed.
     */
    std::string dateString() const;
    
    /**
     * Publish time as HH:MM:SS (UTC)
     * 
     * Empty when the publish date could not be parsed.
     */
    std::string timeString() const;
};

} // namespace noos
