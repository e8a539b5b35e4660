/**
 * Noos - Platform Abstraction
 * 
 * Per-user directories for configuration, logs and caches.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace noos {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     * 
     * Linux:   ~/.config/noos/
     * Windows: %APPDATA%\noos\
     */
    static std::filesystem::path getConfigPath();
    
    /**
     * Get the data directory path (for logs)
     * 
     * Linux:   ~/.local/share/noos/
     * Windows: %LOCALAPPDATA%\noos\
     */
    static std::filesystem::path getDataPath();
    
    /**
     * Get the cache directory path
     * 
     * Linux:   ~/.cache/noos/
     * Windows: %LOCALAPPDATA%\noos\cache\
     */
    static std::filesystem::path getCachePath();
};

} // namespace noos
