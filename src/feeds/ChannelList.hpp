/**
 * Noos - Channel List
 * 
 * The subscribed feed URLs, persisted as plain text.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace noos {

/**
 * Subscribed feeds
 * 
 * File format: one URL per line. Blank lines and lines starting with
 * '#' are ignored, surrounding whitespace is trimmed.
 */
class ChannelList {
public:
    ChannelList() = default;
    explicit ChannelList(std::filesystem::path path);
    
    /**
     * Load the list from its file
     * 
     * A missing file is an empty list.
     * 
     * @return false if the file exists but cannot be read
     */
    bool load();
    
    /**
     * Write the list to its file, creating parent directories
     */
    bool save() const;
    
    const std::vector<std::string>& urls() const { return m_urls; }
    const std::filesystem::path& path() const { return m_path; }
    
    bool contains(const std::string& url) const;
    
    /**
     * Add a URL
     * 
     * @return false if the URL is empty or already subscribed
     */
    bool add(const std::string& url);
    
    /**
     * Remove a URL
     * 
     * @return false if the URL was not subscribed
     */
    bool remove(const std::string& url);

private:
    std::filesystem::path m_path;
    std::vector<std::string> m_urls;
};

} // namespace noos
