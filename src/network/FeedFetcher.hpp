/**
 * Noos - Feed Fetcher
 * 
 * Downloads feeds over HTTP(S).
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>

#include <QByteArray>
#include <QFuture>

#include "feeds/Feed.hpp"

namespace noos {

/**
 * Download a feed, blocking the calling thread
 * 
 * Runs its own event loop, so it may be called from worker threads.
 * 
 * @param feedUrl URL of the feed
 * @param timeoutMs Give up after this many milliseconds
 * @return Response body, or std::nullopt on network error or timeout
 */
std::optional<QByteArray> downloadFeed(const std::string& feedUrl, int timeoutMs);

/**
 * Download and parse a feed on the global thread pool
 * 
 * @param feedUrl URL of the feed
 * @param timeoutMs Request timeout in milliseconds
 * @param maxItems Maximum items to keep (0 = all)
 * @return Parsed feed, or std::nullopt if it could not be fetched or parsed
 */
QFuture<std::optional<ParsedFeed>> fetchFeed(
    const std::string& feedUrl,
    int timeoutMs,
    int maxItems = 0
);

} // namespace noos
