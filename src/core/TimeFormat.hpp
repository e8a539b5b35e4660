/**
 * Noos - Time Formatting
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace noos {

/**
 * Format seconds since epoch as YYYY-MM-DD in UTC
 */
std::string formatUtcDate(std::int64_t seconds);

/**
 * Format seconds since epoch as HH:MM:SS in UTC
 */
std::string formatUtcTime(std::int64_t seconds);

/**
 * Seconds since epoch of a system clock time point
 */
std::int64_t toUnixSeconds(std::chrono::system_clock::time_point time);

} // namespace noos
