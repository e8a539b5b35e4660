/**
 * Noos - Placeholder Scanner Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PlaceholderScanner.hpp"

#include <spdlog/spdlog.h>

namespace noos {

namespace {
    constexpr char ESCAPE_CHAR = '\\';
}

std::string placeholderLiteral(std::string_view name) {
    std::string literal;
    literal.reserve(name.size() + 3);
    literal.append("${");
    literal.append(name);
    literal.push_back('}');
    return literal;
}

PlaceholderScan scanPlaceholder(std::string_view text, std::string_view name) {
    PlaceholderScan scan;
    const std::string literal = placeholderLiteral(name);
    
    std::size_t pos = text.find(literal);
    while (pos != std::string_view::npos) {
        std::size_t end = pos + literal.size();
        
        if (pos > 0 && text[pos - 1] == ESCAPE_CHAR) {
            spdlog::debug("Placeholder '{}' at {} is escaped, ignoring", literal, pos);
            scan.escapes.push_back(pos - 1);
        } else {
            spdlog::debug("Found placeholder '{}' at ({}-{})", literal, pos, end);
            scan.live.push_back({pos, end});
        }
        
        pos = text.find(literal, end);
    }
    
    if (scan.live.empty()) {
        spdlog::debug("Placeholder '{}' not found in template", literal);
    }
    
    return scan;
}

std::vector<PlaceholderSpan> findPlaceholder(std::string_view text, std::string_view name) {
    return scanPlaceholder(text, name).live;
}

} // namespace noos
