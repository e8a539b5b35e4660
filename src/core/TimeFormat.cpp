/**
 * Noos - Time Formatting Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "TimeFormat.hpp"

#include <ctime>

#include <spdlog/fmt/chrono.h>

namespace noos {

namespace {

std::tm toUtc(std::int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm;
}

} // anonymous namespace

std::string formatUtcDate(std::int64_t seconds) {
    return fmt::format("{:%Y-%m-%d}", toUtc(seconds));
}

std::string formatUtcTime(std::int64_t seconds) {
    return fmt::format("{:%H:%M:%S}", toUtc(seconds));
}

std::int64_t toUnixSeconds(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        time.time_since_epoch()).count();
}

} // namespace noos
