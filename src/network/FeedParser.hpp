/**
 * Noos - Feed Parser
 * 
 * RSS/Atom feed parsing into timeline-ready feed data.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <QString>

#include "feeds/Feed.hpp"

namespace noos {

/**
 * Parse a publish date
 * 
 * Tries RFC 2822 (RSS) first, then ISO 8601 (Atom).
 * 
 * @return Seconds since epoch, or std::nullopt if neither format matches
 */
std::optional<std::int64_t> parsePublishedDate(const QString& text);

/**
 * Parse feed content
 * 
 * Supports RSS 2.0 and Atom feeds. Elements missing from an item stay
 * std::nullopt; present but empty elements become empty strings.
 * 
 * @param content Feed XML content
 * @param feedUrl URL the content was fetched from
 * @param maxItems Maximum items to return (0 = all)
 * @return Parsed feed, or std::nullopt if the XML is malformed
 */
std::optional<ParsedFeed> parseFeed(
    const QString& content,
    const std::string& feedUrl,
    int maxItems = 0
);

} // namespace noos
