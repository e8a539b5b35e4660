/**
 * Noos - Page Template
 * 
 * Template for the page surrounding the rendered timeline.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "CompiledTemplate.hpp"
#include "ItemTemplate.hpp"
#include "core/Entry.hpp"
#include "core/TimelineStore.hpp"

namespace noos {

/**
 * Placeholders available in page templates
 */
enum class PagePlaceholder {
    Items,
    ItemCount,
    ChannelCount,
    Date,
    Time,
    Timestamp
};

/**
 * Aggregate values a page is rendered from
 */
struct PageContext {
    std::string items;              // Concatenated item renders, already escaped
    std::size_t itemCount = 0;
    std::size_t channelCount = 0;
    std::int64_t renderTime = 0;    // Seconds since epoch
};

namespace page_values {
std::string items(const PageContext& page);
std::string itemCount(const PageContext& page);
std::string channelCount(const PageContext& page);
std::string date(const PageContext& page);
std::string time(const PageContext& page);
std::string timestamp(const PageContext& page);
} // namespace page_values

/**
 * Placeholder table for page templates
 */
struct PagePlaceholders {
    using Kind = PagePlaceholder;
    using Context = PageContext;
    using Spec = PlaceholderSpec<Kind, Context>;
    
    static constexpr const char* NAME = "Page";
    
    static constexpr std::array<Spec, 6> SPECS = {{
        {Kind::Items,        "items",         &page_values::items, false},
        {Kind::ItemCount,    "item_count",    &page_values::itemCount},
        {Kind::ChannelCount, "channel_count", &page_values::channelCount},
        {Kind::Date,         "date",          &page_values::date},
        {Kind::Time,         "time",          &page_values::time},
        {Kind::Timestamp,    "timestamp",     &page_values::timestamp},
    }};
};

/**
 * Entries that should appear on a page rendered at renderTime
 * 
 * Drops entries dated strictly after renderTime and orders the rest
 * newest first. Entries with equal timestamps are ordered by their
 * content, so the result does not depend on insertion order.
 */
std::vector<Entry> selectRenderable(std::vector<Entry> entries, std::int64_t renderTime);

/**
 * Number of distinct source links among entries
 */
std::size_t countChannels(const std::vector<Entry>& entries);

/**
 * A compiled page template
 */
class PageTemplate {
public:
    explicit PageTemplate(std::string text);
    
    const CompiledTemplate<PagePlaceholders>& compiled() const { return m_template; }
    const std::string& text() const { return m_template.text(); }
    
    /**
     * Render a page from the store using the current wall clock
     */
    std::string render(const TimelineStore& store, const ItemTemplate& itemTemplate) const;
    
    /**
     * Render a page from the store as of renderTime
     * 
     * The store is read once through a snapshot; its lock is not held
     * while rendering.
     */
    std::string render(
        const TimelineStore& store,
        const ItemTemplate& itemTemplate,
        std::int64_t renderTime
    ) const;
    
    /**
     * Render a page from an entry snapshot as of renderTime
     * 
     * If the template has no ${items} placeholder, a warning is logged
     * and the template text is returned unchanged.
     */
    std::string render(
        std::vector<Entry> entries,
        const ItemTemplate& itemTemplate,
        std::int64_t renderTime
    ) const;
    
    /**
     * Aggregate values for a page rendered at renderTime
     */
    static PageContext buildContext(
        std::vector<Entry> entries,
        const ItemTemplate& itemTemplate,
        std::int64_t renderTime
    );

private:
    CompiledTemplate<PagePlaceholders> m_template;
};

} // namespace noos
