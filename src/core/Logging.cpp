/**
 * Noos - Logging Setup Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace noos {

namespace {
    constexpr const char* LOG_FILE = "noos.log";
    constexpr std::size_t MAX_LOG_SIZE = 1024 * 1024 * 5;
    constexpr std::size_t MAX_LOG_FILES = 3;
}

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "0" || lower == "error") return spdlog::level::err;
    if (lower == "1" || lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "2" || lower == "info") return spdlog::level::info;
    if (lower == "3" || lower == "debug") return spdlog::level::debug;
    
    return std::nullopt;
}

void setupLogging(spdlog::level::level_enum consoleLevel, const std::filesystem::path& logDirectory) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(consoleLevel);
    
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::string fileError;
    
    try {
        std::filesystem::create_directories(logDirectory);
        auto logPath = logDirectory / LOG_FILE;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), MAX_LOG_SIZE, MAX_LOG_FILES);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    } catch (const std::exception& e) {
        fileError = e.what();
    }
    
    auto logger = std::make_shared<spdlog::logger>("noos", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    
    spdlog::set_default_logger(logger);
    
    if (!fileError.empty()) {
        spdlog::warn("Failed to open log file, logging to console only: {}", fileError);
    }
}

void setConsoleLevel(spdlog::level::level_enum level) {
    auto logger = spdlog::default_logger();
    if (!logger->sinks().empty()) {
        logger->sinks().front()->set_level(level);
    }
}

} // namespace noos
