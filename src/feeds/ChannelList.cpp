/**
 * Noos - Channel List Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ChannelList.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace noos {

namespace {

std::string trim(const std::string& s) {
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

} // anonymous namespace

ChannelList::ChannelList(std::filesystem::path path)
    : m_path(std::move(path))
{
}

bool ChannelList::load() {
    m_urls.clear();
    
    if (!std::filesystem::exists(m_path)) {
        spdlog::debug("No channel list found at: {}", m_path.string());
        return true;
    }
    
    std::ifstream file(m_path);
    if (!file.is_open()) {
        spdlog::error("Failed to open channel list: {}", m_path.string());
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        std::string url = trim(line);
        if (url.empty() || url[0] == '#') {
            continue;
        }
        add(url);
    }
    
    spdlog::debug("Loaded {} channels", m_urls.size());
    return true;
}

bool ChannelList::save() const {
    try {
        if (m_path.has_parent_path()) {
            std::filesystem::create_directories(m_path.parent_path());
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to create channel list directory: {}", e.what());
        return false;
    }
    
    std::ofstream file(m_path, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("Failed to save channel list to: {}", m_path.string());
        return false;
    }
    
    for (const auto& url : m_urls) {
        file << url << '\n';
    }
    
    if (!file) {
        spdlog::error("Failed to write channel list: {}", m_path.string());
        return false;
    }
    
    spdlog::debug("Saved {} channels", m_urls.size());
    return true;
}

bool ChannelList::contains(const std::string& url) const {
    return std::find(m_urls.begin(), m_urls.end(), trim(url)) != m_urls.end();
}

bool ChannelList::add(const std::string& url) {
    std::string cleaned = trim(url);
    if (cleaned.empty() || contains(cleaned)) {
        return false;
    }
    m_urls.push_back(cleaned);
    return true;
}

bool ChannelList::remove(const std::string& url) {
    auto it = std::find(m_urls.begin(), m_urls.end(), trim(url));
    if (it == m_urls.end()) {
        return false;
    }
    m_urls.erase(it);
    return true;
}

} // namespace noos
