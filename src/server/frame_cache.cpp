#include "frame_cache.hpp"
#include <utility>

namespace terrastream::server {

using namespace terrastream::protocol;

FrameCache::FrameCache(size_t max_entries, std::chrono::milliseconds max_age)
    : max_entries_(max_entries)
    , max_age_(max_age) {
}

FrameBuffer FrameCache::find(const SessionKey& key, const Grid& grid, Clock::time_point now) {
    if (!enabled()) return nullptr;

    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired(now);

    auto it = index_.find(key);
    if (it == index_.end() || it->second->grid != grid) {
        ++misses_;
        return nullptr;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;
    return it->second->frame;
}

void FrameCache::store(const SessionKey& key, Grid grid, FrameBuffer frame, Clock::time_point now) {
    if (!enabled()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_.erase(it->second);
        index_.erase(it);
    }

    entries_.push_front(Entry{key, std::move(grid), std::move(frame), now});
    index_[key] = entries_.begin();

    while (entries_.size() > max_entries_) {
        index_.erase(entries_.back().key);
        entries_.pop_back();
    }
}

void FrameCache::evict_expired(Clock::time_point now) {
    // Recency order is not age order, so scan everything
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->stored_at > max_age_) {
            index_.erase(it->key);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t FrameCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t FrameCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t FrameCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace terrastream::server
