/**
 * Noos - Timeline Store Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "TimelineStore.hpp"

#include <utility>

namespace noos {

void TimelineStore::append(Entry entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(std::move(entry));
}

std::vector<Entry> TimelineStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

std::size_t TimelineStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool TimelineStore::empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.empty();
}

} // namespace noos
