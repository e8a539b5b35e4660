/**
 * Noos - Item Template
 * 
 * Template for rendering a single timeline entry.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <array>
#include <string>

#include "CompiledTemplate.hpp"
#include "core/Entry.hpp"

namespace noos {

/**
 * Placeholders available in item templates
 */
enum class ItemPlaceholder {
    Title,
    Description,
    Source,
    Link,
    Date,
    Time,
    Timestamp,
    ChannelLink
};

namespace item_values {
std::string title(const Entry& entry);
std::string description(const Entry& entry);
std::string source(const Entry& entry);
std::string link(const Entry& entry);
std::string date(const Entry& entry);
std::string time(const Entry& entry);
std::string timestamp(const Entry& entry);
std::string channelLink(const Entry& entry);
} // namespace item_values

/**
 * Placeholder table for item templates
 * 
 * Adding a placeholder means adding a kind above and a row here.
 */
struct ItemPlaceholders {
    using Kind = ItemPlaceholder;
    using Context = Entry;
    using Spec = PlaceholderSpec<Kind, Context>;
    
    static constexpr const char* NAME = "Item";
    
    static constexpr std::array<Spec, 8> SPECS = {{
        {Kind::Title,       "title",        &item_values::title},
        {Kind::Description, "description",  &item_values::description},
        {Kind::Source,      "source",       &item_values::source},
        {Kind::Link,        "link",         &item_values::link},
        {Kind::Date,        "date",         &item_values::date},
        {Kind::Time,        "time",         &item_values::time},
        {Kind::Timestamp,   "timestamp",    &item_values::timestamp},
        {Kind::ChannelLink, "channel_link", &item_values::channelLink},
    }};
};

/**
 * A compiled item template
 * 
 * Rendering an entry yields one HTML fragment with every field escaped.
 * Output depends only on the template and the entry.
 */
using ItemTemplate = CompiledTemplate<ItemPlaceholders>;

} // namespace noos
