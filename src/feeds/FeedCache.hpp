/**
 * Noos - Feed Cache
 * 
 * Binary cache of the last fetched feeds, for rendering without network.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "Feed.hpp"

namespace noos {

/**
 * Cache format version written by saveFeedCache
 */
constexpr int FEED_CACHE_VERSION = 1;

/**
 * Write feeds as MessagePack, replacing the file
 */
bool saveFeedCache(const std::filesystem::path& path, const std::vector<ParsedFeed>& feeds);

/**
 * Read feeds written by saveFeedCache
 * 
 * @return std::nullopt if the file is missing, unreadable, malformed
 *         or written by another cache version
 */
std::optional<std::vector<ParsedFeed>> loadFeedCache(const std::filesystem::path& path);

/**
 * Feeds to write back to the cache after a fetch
 * 
 * For every subscribed URL, in subscription order: the feed fetched by
 * this run, else its copy from the previous cache, else nothing. Feeds
 * no longer subscribed are dropped.
 */
std::vector<ParsedFeed> mergeFeeds(
    const std::vector<std::string>& subscribed,
    std::vector<ParsedFeed> fetched,
    std::vector<ParsedFeed> cached
);

} // namespace noos
