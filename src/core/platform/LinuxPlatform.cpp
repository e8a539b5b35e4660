/**
 * Noos - Platform Implementation (Linux)
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "Platform.hpp"

#include <cstdlib>

namespace noos {

namespace {

/**
 * $<xdgVariable>/noos, else ~/<homeFallback>/noos
 */
std::filesystem::path xdgPath(const char* xdgVariable, const char* homeFallback) {
    const char* xdg = std::getenv(xdgVariable);
    if (xdg && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "noos";
    }
    
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / homeFallback / "noos";
    }
    
    return std::filesystem::path(homeFallback) / "noos";
}

} // anonymous namespace

std::filesystem::path Platform::getConfigPath() {
    return xdgPath("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path Platform::getDataPath() {
    return xdgPath("XDG_DATA_HOME", ".local/share");
}

std::filesystem::path Platform::getCachePath() {
    return xdgPath("XDG_CACHE_HOME", ".cache");
}

} // namespace noos

#endif // PLATFORM_LINUX
