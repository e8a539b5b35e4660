/**
 * Noos - Configuration Manager Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace noos {

namespace {
    constexpr const char* PROGRAM_CONFIG_FILE = "config.json";
    constexpr const char* CHANNELS_FILE = "channels.txt";
}

ProgramConfig ProgramConfig::fromJson(const std::string& json) {
    ProgramConfig config;
    
    auto j = nlohmann::json::parse(json);
    
    if (j.contains("logVerbosity")) {
        config.logVerbosity = j["logVerbosity"].get<std::string>();
    }
    if (j.contains("itemTemplate")) {
        config.itemTemplate = j["itemTemplate"].get<std::string>();
    }
    if (j.contains("pageTemplate")) {
        config.pageTemplate = j["pageTemplate"].get<std::string>();
    }
    if (j.contains("outputFile")) {
        config.outputFile = j["outputFile"].get<std::string>();
    }
    if (j.contains("fetchTimeoutMs")) {
        config.fetchTimeoutMs = j["fetchTimeoutMs"].get<int>();
    }
    if (j.contains("maxItemsPerFeed")) {
        config.maxItemsPerFeed = j["maxItemsPerFeed"].get<int>();
    }
    
    return config;
}

std::string ProgramConfig::toJson() const {
    nlohmann::json j;
    
    j["logVerbosity"] = logVerbosity;
    j["itemTemplate"] = itemTemplate;
    j["pageTemplate"] = pageTemplate;
    j["outputFile"] = outputFile;
    j["fetchTimeoutMs"] = fetchTimeoutMs;
    j["maxItemsPerFeed"] = maxItemsPerFeed;
    
    return j.dump(2);
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_programConfig = ProgramConfig();
    
    // Create directories if they don't exist
    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }
    
    // Check if this is first run
    m_isFirstRun = !std::filesystem::exists(configFile());
    
    if (m_isFirstRun) {
        if (!saveProgramConfig()) {
            spdlog::warn("Failed to write default program config");
        }
    } else if (!loadProgramConfig()) {
        spdlog::warn("Failed to load program config, using defaults");
    }
    
    spdlog::info("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

std::filesystem::path ConfigManager::channelsFile() const {
    return m_configDirectory / CHANNELS_FILE;
}

std::filesystem::path ConfigManager::configFile() const {
    return m_configDirectory / PROGRAM_CONFIG_FILE;
}

bool ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    return saveProgramConfig();
}

bool ConfigManager::loadProgramConfig() {
    try {
        std::ifstream file(configFile());
        if (!file.is_open()) {
            return false;
        }
        
        std::stringstream buffer;
        buffer << file.rdbuf();
        m_programConfig = ProgramConfig::fromJson(buffer.str());
        
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load program config: {}", e.what());
        m_programConfig = ProgramConfig();
        return false;
    }
}

bool ConfigManager::saveProgramConfig() {
    std::ofstream file(configFile());
    if (!file.is_open()) {
        spdlog::error("Failed to open config file for writing: {}", configFile().string());
        return false;
    }
    
    file << m_programConfig.toJson();
    if (!file) {
        spdlog::error("Failed to write program config");
        return false;
    }
    
    spdlog::debug("Saved program config to: {}", configFile().string());
    return true;
}

} // namespace noos
