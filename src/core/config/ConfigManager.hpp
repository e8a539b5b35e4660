/**
 * Noos - Configuration Manager
 * 
 * Manages the program configuration file.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace noos {

/**
 * Program-wide settings, stored as config.json
 */
struct ProgramConfig {
    std::string logVerbosity = "info";      // error, warn, info, debug
    std::string itemTemplate;               // Path, empty for default lookup
    std::string pageTemplate;               // Path, empty for default lookup
    std::string outputFile = "noos.html";
    int fetchTimeoutMs = 15000;
    int maxItemsPerFeed = 0;                // 0 = all
    
    /**
     * Parse config.json content; missing keys keep their defaults
     * 
     * @throws nlohmann::json::exception on malformed JSON or wrong value types
     */
    static ProgramConfig fromJson(const std::string& json);
    std::string toJson() const;
};

/**
 * Owner of the configuration directory
 * 
 * Handles loading and saving config.json and locating the other
 * per-user files (channel list, user templates).
 */
class ConfigManager {
public:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    
    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    
    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }
    std::filesystem::path channelsFile() const;
    std::filesystem::path configFile() const;
    
    // Program config
    const ProgramConfig& programConfig() const { return m_programConfig; }
    
    /**
     * Replace the program config and write it to config.json
     * 
     * @return false if the file could not be written; the new config
     *         still applies to this run
     */
    bool setProgramConfig(const ProgramConfig& config);

private:
    bool loadProgramConfig();
    bool saveProgramConfig();
    
    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;
    
    ProgramConfig m_programConfig;
};

} // namespace noos
