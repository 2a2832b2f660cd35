#pragma once

#include "protocol/chunk_key.hpp"
#include "protocol/grid.hpp"
#include "server/delivery.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <unordered_map>

namespace terrastream::server {

/**
 * Pre-compressed full-grid frames shared by all connections.
 *
 * Keyed by (chunk, LOD). An entry is only served while the grid it was
 * encoded from still equals the grid being sent, so a changed data source
 * can never produce a stale frame. Bounded by entry count (LRU) and age.
 */
class FrameCache {
public:
    using Clock = std::chrono::steady_clock;

    FrameCache(size_t max_entries, std::chrono::milliseconds max_age);

    // Cached frame for exactly this grid, or nullptr
    FrameBuffer find(const protocol::SessionKey& key, const protocol::Grid& grid,
                     Clock::time_point now = Clock::now());

    void store(const protocol::SessionKey& key, protocol::Grid grid, FrameBuffer frame,
               Clock::time_point now = Clock::now());

    bool enabled() const { return max_entries_ > 0; }
    size_t size() const;
    uint64_t hits() const;
    uint64_t misses() const;

private:
    struct Entry {
        protocol::SessionKey key;
        protocol::Grid grid;
        FrameBuffer frame;
        Clock::time_point stored_at;
    };
    using EntryList = std::list<Entry>;

    void evict_expired(Clock::time_point now);

    const size_t max_entries_;
    const std::chrono::milliseconds max_age_;

    mutable std::mutex mutex_;
    EntryList entries_;  // most recently used first
    std::unordered_map<protocol::SessionKey, EntryList::iterator, protocol::SessionKeyHash> index_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace terrastream::server
