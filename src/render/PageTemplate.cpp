/**
 * Noos - Page Template Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PageTemplate.hpp"
#include "core/TimeFormat.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <utility>

#include <spdlog/spdlog.h>

namespace noos {

namespace page_values {

std::string items(const PageContext& page) {
    return page.items;
}

std::string itemCount(const PageContext& page) {
    return std::to_string(page.itemCount);
}

std::string channelCount(const PageContext& page) {
    return std::to_string(page.channelCount);
}

std::string date(const PageContext& page) {
    return formatUtcDate(page.renderTime);
}

std::string time(const PageContext& page) {
    return formatUtcTime(page.renderTime);
}

std::string timestamp(const PageContext& page) {
    return std::to_string(page.renderTime);
}

} // namespace page_values

namespace {

// Newest first; ties broken by content so the order is total
bool renderedBefore(const Entry& a, const Entry& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp > b.timestamp;
    }
    return std::tie(a.sourceLink, a.link, a.title, a.description, a.sourceName)
         < std::tie(b.sourceLink, b.link, b.title, b.description, b.sourceName);
}

} // anonymous namespace

std::vector<Entry> selectRenderable(std::vector<Entry> entries, std::int64_t renderTime) {
    entries.erase(
        std::remove_if(entries.begin(), entries.end(),
            [renderTime](const Entry& entry) {
                return entry.timestamp > renderTime;
            }),
        entries.end()
    );
    std::sort(entries.begin(), entries.end(), renderedBefore);
    return entries;
}

std::size_t countChannels(const std::vector<Entry>& entries) {
    std::set<std::string> links;
    for (const auto& entry : entries) {
        links.insert(entry.sourceLink);
    }
    return links.size();
}

PageTemplate::PageTemplate(std::string text)
    : m_template(std::move(text))
{
}

std::string PageTemplate::render(
    const TimelineStore& store,
    const ItemTemplate& itemTemplate
) const {
    return render(store, itemTemplate, toUnixSeconds(std::chrono::system_clock::now()));
}

std::string PageTemplate::render(
    const TimelineStore& store,
    const ItemTemplate& itemTemplate,
    std::int64_t renderTime
) const {
    return render(store.snapshot(), itemTemplate, renderTime);
}

std::string PageTemplate::render(
    std::vector<Entry> entries,
    const ItemTemplate& itemTemplate,
    std::int64_t renderTime
) const {
    if (!m_template.contains(PagePlaceholder::Items)) {
        spdlog::warn("No ${{items}} placeholder found in page template");
        return m_template.text();
    }
    
    PageContext context = buildContext(std::move(entries), itemTemplate, renderTime);
    spdlog::debug("Rendering page with {} items from {} channels",
                  context.itemCount, context.channelCount);
    
    // Item markup is moved into place, resolve() would copy it
    std::string items = std::move(context.items);
    context.items.clear();
    
    auto values = m_template.resolve(context);
    values[CompiledTemplate<PagePlaceholders>::valueIndex(PagePlaceholder::Items)] = std::move(items);
    
    return m_template.assemble(values);
}

PageContext PageTemplate::buildContext(
    std::vector<Entry> entries,
    const ItemTemplate& itemTemplate,
    std::int64_t renderTime
) {
    auto selected = selectRenderable(std::move(entries), renderTime);
    
    std::vector<std::string> rendered;
    rendered.reserve(selected.size());
    std::size_t total = 0;
    for (const auto& entry : selected) {
        rendered.push_back(itemTemplate.render(entry));
        total += rendered.back().size();
    }
    
    PageContext context;
    context.items.reserve(total);
    for (const auto& item : rendered) {
        context.items.append(item);
    }
    context.itemCount = selected.size();
    context.channelCount = countChannels(selected);
    context.renderTime = renderTime;
    
    return context;
}

} // namespace noos
