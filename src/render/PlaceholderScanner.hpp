/**
 * Noos - Placeholder Scanner
 * 
 * Locates ${name} placeholders in template text.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace noos {

/**
 * Byte range [start, end) of one placeholder in a template
 */
struct PlaceholderSpan {
    std::size_t start = 0;
    std::size_t end = 0;
    
    bool operator==(const PlaceholderSpan& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * Result of scanning a template for one placeholder name
 * 
 * An occurrence written as \${name} is escaped: it is not substituted,
 * and `escapes` holds the offset of its backslash so the renderer can
 * drop that one byte.
 */
struct PlaceholderScan {
    std::vector<PlaceholderSpan> live;
    std::vector<std::size_t> escapes;
};

/**
 * The literal token for a placeholder name, e.g. "${title}"
 */
std::string placeholderLiteral(std::string_view name);

/**
 * Find all occurrences of ${name}, live and escaped, in order
 */
PlaceholderScan scanPlaceholder(std::string_view text, std::string_view name);

/**
 * Find all live (unescaped) occurrences of ${name}, in order
 * 
 * @param text Template text
 * @param name Placeholder name without delimiters, matched case-sensitively
 * @return Byte ranges of each occurrence, empty if there are none
 */
std::vector<PlaceholderSpan> findPlaceholder(std::string_view text, std::string_view name);

} // namespace noos
