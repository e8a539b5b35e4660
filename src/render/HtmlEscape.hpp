/**
 * Noos - HTML Escaping
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace noos {

/**
 * Escape text for safe inclusion in HTML content and attribute values
 * 
 * Replaces & < > " ' with their entity forms. All other bytes, including
 * multi-byte UTF-8 sequences, are copied unchanged.
 */
std::string escapeHtml(std::string_view text);

/**
 * Length escapeHtml(text) will produce
 */
std::size_t escapedHtmlLength(std::string_view text);

} // namespace noos
