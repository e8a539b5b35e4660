/**
 * Noos - Timeline Store
 * 
 * The in-memory collection of entries shared by ingestion and rendering.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "Entry.hpp"

namespace noos {

/**
 * Append-only store of timeline entries
 * 
 * Entries are kept in insertion order; ordering and filtering happen
 * at render time. Every operation takes the store's single lock for its
 * own duration only, so ingestion workers may append concurrently while
 * a renderer takes a snapshot.
 * 
 * Constructed once per run and passed by reference to the ingestion
 * and render steps.
 */
class TimelineStore {
public:
    TimelineStore() = default;
    ~TimelineStore() = default;
    TimelineStore(const TimelineStore&) = delete;
    TimelineStore& operator=(const TimelineStore&) = delete;
    
    /**
     * Add one entry
     */
    void append(Entry entry);
    
    /**
     * Copy of all entries at a single point in time
     */
    std::vector<Entry> snapshot() const;
    
    std::size_t size() const;
    bool empty() const;

private:
    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
};

} // namespace noos
