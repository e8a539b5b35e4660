/**
 * Noos - Template Loader
 * 
 * Chooses and reads the template text handed to the template compiler.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "ItemTemplate.hpp"
#include "PageTemplate.hpp"

namespace noos {

/**
 * A template file that was selected but could not be read
 */
class TemplateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Candidate locations of one template, in precedence order
 */
struct TemplateSource {
    std::optional<std::filesystem::path> commandLinePath;
    std::optional<std::filesystem::path> configuredPath;   // From config.json
    std::filesystem::path userPath;                        // <config dir>/templates/*.html
    std::string builtin;
};

/**
 * Read a whole template file
 * 
 * @throws TemplateError if the file cannot be opened or read
 */
std::string readTemplateFile(const std::filesystem::path& path);

/**
 * Template text from the first available source
 * 
 * Explicit paths (command line, then config) must be readable; the user
 * template directory is only used if the file exists; otherwise the
 * built-in template is returned.
 * 
 * @throws TemplateError if an explicit path cannot be read
 */
std::string loadTemplateText(const TemplateSource& source);

/**
 * Sources for the item and page templates of a config directory
 */
TemplateSource itemTemplateSource(
    const std::filesystem::path& configDirectory,
    const std::optional<std::filesystem::path>& commandLinePath,
    const std::string& configuredPath
);

TemplateSource pageTemplateSource(
    const std::filesystem::path& configDirectory,
    const std::optional<std::filesystem::path>& commandLinePath,
    const std::string& configuredPath
);

ItemTemplate loadItemTemplate(const TemplateSource& source);
PageTemplate loadPageTemplate(const TemplateSource& source);

} // namespace noos
