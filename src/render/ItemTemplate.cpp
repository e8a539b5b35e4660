/**
 * Noos - Item Template Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ItemTemplate.hpp"

namespace noos {

namespace item_values {

std::string title(const Entry& entry) {
    return entry.displayTitle();
}

std::string description(const Entry& entry) {
    return entry.displayDescription();
}

std::string source(const Entry& entry) {
    return entry.displaySource();
}

std::string link(const Entry& entry) {
    return entry.displayLink();
}

std::string date(const Entry& entry) {
    return entry.dateString();
}

std::string time(const Entry& entry) {
    return entry.timeString();
}

std::string timestamp(const Entry& entry) {
    return std::to_string(entry.timestamp);
}

std::string channelLink(const Entry& entry) {
    return entry.sourceLink;
}

} // namespace item_values

} // namespace noos
