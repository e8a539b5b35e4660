/**
 * Noos - Timeline Entry Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Entry.hpp"
#include "TimeFormat.hpp"

namespace noos {

std::string Entry::displayTitle() const {
    return title.value_or(NO_TITLE_TEXT);
}

std::string Entry::displayDescription() const {
    return description.value_or(NO_DESCRIPTION_TEXT);
}

std::string Entry::displaySource() const {
    return sourceName.value_or(NO_SOURCE_TEXT);
}

std::string Entry::displayLink() const {
    return link.value_or(std::string());
}

std::string Entry::dateString() const {
    if (!hasPublishedDate) {
        return {};
    }
    return formatUtcDate(timestamp);
}

std::string Entry::timeString() const {
    if (!hasPublishedDate) {
        return {};
    }
    return formatUtcTime(timestamp);
}

} // namespace noos
