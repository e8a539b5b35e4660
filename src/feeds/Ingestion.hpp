/**
 * Noos - Feed Ingestion
 * 
 * Converts parsed feeds into timeline entries.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "Feed.hpp"
#include "core/Entry.hpp"
#include "core/TimelineStore.hpp"

namespace noos {

/**
 * How far before ingestion an item without a usable date is placed
 */
constexpr std::chrono::seconds MISSING_DATE_OFFSET{60};

/**
 * Outcome of ingesting one feed
 */
struct IngestReport {
    std::size_t appended = 0;
    std::size_t fallbackTimestamps = 0;     // Items whose date was missing or invalid
};

/**
 * Build the timeline entry for one feed item
 * 
 * Items without a parsed publish date get ingestedAt - MISSING_DATE_OFFSET
 * as timestamp and render with empty date and time.
 */
Entry makeEntry(const FeedItem& item, const ParsedFeed& feed, std::int64_t ingestedAt);

/**
 * Append every item of a feed to the store
 * 
 * Logs a single warning for the batch if any item needed a fallback
 * timestamp.
 */
IngestReport ingestFeed(TimelineStore& store, const ParsedFeed& feed, std::int64_t ingestedAt);

} // namespace noos
