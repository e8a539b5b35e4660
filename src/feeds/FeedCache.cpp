/**
 * Noos - Feed Cache Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "FeedCache.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace noos {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

nlohmann::json itemToJson(const FeedItem& item) {
    nlohmann::json j;
    j["title"] = optionalToJson(item.title);
    j["description"] = optionalToJson(item.description);
    j["link"] = optionalToJson(item.link);
    j["pubDate"] = optionalToJson(item.pubDate);
    j["publishedAt"] = optionalToJson(item.publishedAt);
    return j;
}

FeedItem itemFromJson(const nlohmann::json& j) {
    FeedItem item;
    item.title = optionalFromJson<std::string>(j, "title");
    item.description = optionalFromJson<std::string>(j, "description");
    item.link = optionalFromJson<std::string>(j, "link");
    item.pubDate = optionalFromJson<std::string>(j, "pubDate");
    item.publishedAt = optionalFromJson<std::int64_t>(j, "publishedAt");
    return item;
}

nlohmann::json feedToJson(const ParsedFeed& feed) {
    nlohmann::json j;
    j["url"] = feed.url;
    j["title"] = optionalToJson(feed.title);
    j["link"] = feed.link;
    
    auto items = nlohmann::json::array();
    for (const auto& item : feed.items) {
        items.push_back(itemToJson(item));
    }
    j["items"] = std::move(items);
    return j;
}

std::vector<ParsedFeed>::iterator findByUrl(std::vector<ParsedFeed>& feeds, const std::string& url) {
    return std::find_if(feeds.begin(), feeds.end(),
        [&url](const ParsedFeed& feed) { return feed.url == url; });
}

ParsedFeed feedFromJson(const nlohmann::json& j) {
    ParsedFeed feed;
    feed.url = j.at("url").get<std::string>();
    feed.title = optionalFromJson<std::string>(j, "title");
    feed.link = j.value("link", std::string());
    
    for (const auto& item : j.at("items")) {
        feed.items.push_back(itemFromJson(item));
    }
    return feed;
}

} // anonymous namespace

bool saveFeedCache(const std::filesystem::path& path, const std::vector<ParsedFeed>& feeds) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        
        nlohmann::json j;
        j["version"] = FEED_CACHE_VERSION;
        j["feeds"] = nlohmann::json::array();
        for (const auto& feed : feeds) {
            j["feeds"].push_back(feedToJson(feed));
        }
        
        std::vector<std::uint8_t> bytes = nlohmann::json::to_msgpack(j);
        
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("Failed to create cache file: {}", path.string());
            return false;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            spdlog::error("Failed to write cache file: {}", path.string());
            return false;
        }
        
        spdlog::debug("Cached {} feeds ({} bytes) to {}", feeds.size(), bytes.size(), path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save feed cache: {}", e.what());
        return false;
    }
}

std::optional<std::vector<ParsedFeed>> loadFeedCache(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Failed to open cache file: {}", path.string());
        return std::nullopt;
    }
    
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    
    try {
        auto j = nlohmann::json::from_msgpack(bytes);
        
        int version = j.value("version", 0);
        if (version != FEED_CACHE_VERSION) {
            spdlog::error("Unsupported feed cache version {} in {}", version, path.string());
            return std::nullopt;
        }
        
        std::vector<ParsedFeed> feeds;
        for (const auto& feed : j.at("feeds")) {
            feeds.push_back(feedFromJson(feed));
        }
        
        spdlog::debug("Loaded {} feeds from cache {}", feeds.size(), path.string());
        return feeds;
    } catch (const std::exception& e) {
        spdlog::error("Failed to decode cache file {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::vector<ParsedFeed> mergeFeeds(
    const std::vector<std::string>& subscribed,
    std::vector<ParsedFeed> fetched,
    std::vector<ParsedFeed> cached
) {
    std::vector<ParsedFeed> merged;
    merged.reserve(subscribed.size());
    std::size_t kept = 0;
    
    for (const auto& url : subscribed) {
        auto fresh = findByUrl(fetched, url);
        if (fresh != fetched.end()) {
            merged.push_back(std::move(*fresh));
            continue;
        }
        
        auto old = findByUrl(cached, url);
        if (old != cached.end()) {
            merged.push_back(std::move(*old));
            ++kept;
        }
    }
    
    if (kept > 0) {
        spdlog::warn("Keeping cached copy of {} channels that could not be fetched", kept);
    }
    return merged;
}

} // namespace noos
