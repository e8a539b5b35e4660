/**
 * Noos - HTML Escaping Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "HtmlEscape.hpp"

namespace noos {

namespace {

std::string_view entityFor(char c) {
    switch (c) {
        case '&':  return "&amp;";
        case '<':  return "&lt;";
        case '>':  return "&gt;";
        case '"':  return "&quot;";
        case '\'': return "&#39;";
        default:   return {};
    }
}

} // anonymous namespace

std::size_t escapedHtmlLength(std::string_view text) {
    std::size_t length = 0;
    for (char c : text) {
        auto entity = entityFor(c);
        length += entity.empty() ? 1 : entity.size();
    }
    return length;
}

std::string escapeHtml(std::string_view text) {
    std::string result;
    result.reserve(escapedHtmlLength(text));
    
    for (char c : text) {
        auto entity = entityFor(c);
        if (entity.empty()) {
            result.push_back(c);
        } else {
            result.append(entity);
        }
    }
    
    return result;
}

} // namespace noos
