/**
 * Noos - Template Loader Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "TemplateLoader.hpp"
#include "DefaultTemplates.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

namespace noos {

namespace {
    constexpr const char* TEMPLATES_DIR = "templates";
    constexpr const char* ITEM_TEMPLATE_FILE = "item.html";
    constexpr const char* PAGE_TEMPLATE_FILE = "page.html";

    TemplateSource makeSource(
        const std::filesystem::path& userPath,
        const std::optional<std::filesystem::path>& commandLinePath,
        const std::string& configuredPath,
        const char* builtin
    ) {
        TemplateSource source;
        source.commandLinePath = commandLinePath;
        if (!configuredPath.empty()) {
            source.configuredPath = std::filesystem::path(configuredPath);
        }
        source.userPath = userPath;
        source.builtin = builtin;
        return source;
    }
}

std::string readTemplateFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw TemplateError("Failed to read template file: " + path.string());
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw TemplateError("Failed to read template file: " + path.string());
    }
    
    spdlog::debug("Read template file: {}", path.string());
    return content.str();
}

std::string loadTemplateText(const TemplateSource& source) {
    if (source.commandLinePath) {
        return readTemplateFile(*source.commandLinePath);
    }
    if (source.configuredPath) {
        return readTemplateFile(*source.configuredPath);
    }
    
    std::error_code ec;
    if (!source.userPath.empty() && std::filesystem::is_regular_file(source.userPath, ec)) {
        return readTemplateFile(source.userPath);
    }
    
    spdlog::debug("Using built-in template");
    return source.builtin;
}

TemplateSource itemTemplateSource(
    const std::filesystem::path& configDirectory,
    const std::optional<std::filesystem::path>& commandLinePath,
    const std::string& configuredPath
) {
    return makeSource(configDirectory / TEMPLATES_DIR / ITEM_TEMPLATE_FILE,
                      commandLinePath, configuredPath, DEFAULT_ITEM_TEMPLATE);
}

TemplateSource pageTemplateSource(
    const std::filesystem::path& configDirectory,
    const std::optional<std::filesystem::path>& commandLinePath,
    const std::string& configuredPath
) {
    return makeSource(configDirectory / TEMPLATES_DIR / PAGE_TEMPLATE_FILE,
                      commandLinePath, configuredPath, DEFAULT_PAGE_TEMPLATE);
}

ItemTemplate loadItemTemplate(const TemplateSource& source) {
    return ItemTemplate(loadTemplateText(source));
}

PageTemplate loadPageTemplate(const TemplateSource& source) {
    return PageTemplate(loadTemplateText(source));
}

} // namespace noos
