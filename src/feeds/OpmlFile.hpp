/**
 * Noos - OPML Import/Export
 * 
 * Exchange of subscription lists with other feed readers.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <QString>

namespace noos {

/**
 * OPML subscription list reader and writer
 */
class OpmlFile {
public:
    /**
     * Read feed URLs from an OPML file
     * 
     * Collects the xmlUrl attribute of every outline element, at any
     * nesting depth, in document order.
     * 
     * @return URLs, or std::nullopt if the file cannot be read or parsed
     */
    static std::optional<std::vector<std::string>> importUrls(const std::filesystem::path& path);
    
    /**
     * Parse OPML content directly
     */
    static std::optional<std::vector<std::string>> parseContent(const QString& content);
    
    /**
     * Write feed URLs as an OPML 2.0 document
     */
    static bool exportUrls(const std::filesystem::path& path, const std::vector<std::string>& urls);
};

} // namespace noos
