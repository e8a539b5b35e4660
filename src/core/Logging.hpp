/**
 * Noos - Logging Setup
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace noos {

/**
 * Parse a verbosity setting
 * 
 * Accepts "error", "warn"/"warning", "info", "debug" (case insensitive)
 * or 0-3 in ascending verbosity (0 = error, 3 = debug).
 */
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text);

/**
 * Install the process-wide "noos" logger
 * 
 * Logs to stdout at consoleLevel and to a rotating file in logDirectory
 * at debug level. Falls back to console only if the log file cannot be
 * created.
 */
void setupLogging(spdlog::level::level_enum consoleLevel, const std::filesystem::path& logDirectory);

/**
 * Change the verbosity of the console sink installed by setupLogging
 */
void setConsoleLevel(spdlog::level::level_enum level);

} // namespace noos
