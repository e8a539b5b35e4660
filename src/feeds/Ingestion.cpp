/**
 * Noos - Feed Ingestion Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Ingestion.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace noos {

Entry makeEntry(const FeedItem& item, const ParsedFeed& feed, std::int64_t ingestedAt) {
    Entry entry;
    entry.title = item.title;
    entry.description = item.description;
    entry.sourceName = feed.title;
    entry.sourceLink = feed.sourceLink();
    entry.link = item.link;
    
    if (item.publishedAt) {
        entry.timestamp = *item.publishedAt;
        entry.hasPublishedDate = true;
    } else {
        entry.timestamp = ingestedAt - MISSING_DATE_OFFSET.count();
        entry.hasPublishedDate = false;
    }
    
    return entry;
}

IngestReport ingestFeed(TimelineStore& store, const ParsedFeed& feed, std::int64_t ingestedAt) {
    IngestReport report;
    
    for (const auto& item : feed.items) {
        Entry entry = makeEntry(item, feed, ingestedAt);
        if (!entry.hasPublishedDate) {
            ++report.fallbackTimestamps;
        }
        store.append(std::move(entry));
        ++report.appended;
    }
    
    if (report.fallbackTimestamps > 0) {
        spdlog::warn("{} of {} items from {} have no valid publish date, placed {}s before now",
                     report.fallbackTimestamps, report.appended, feed.url,
                     MISSING_DATE_OFFSET.count());
    }
    spdlog::debug("Ingested {} items from {}", report.appended, feed.url);
    
    return report;
}

} // namespace noos
