#include "chunk_session.hpp"
#include <utility>

namespace terrastream::server {

using namespace terrastream::protocol;

ChunkSession::ChunkSession(uint64_t connection_id)
    : connection_id_(connection_id) {
}

const Grid* ChunkSession::last_sent(const SessionKey& key) const {
    auto it = last_sent_.find(key);
    if (it != last_sent_.end()) {
        return &it->second.grid;
    }
    return nullptr;
}

void ChunkSession::update_last_sent(const SessionKey& key, Grid grid) {
    auto& snapshot = last_sent_[key];
    snapshot.grid = std::move(grid);
    snapshot.last_sent = std::chrono::steady_clock::now();
    ++snapshot.times_sent;
}

void ChunkSession::forget(const SessionKey& key) {
    last_sent_.erase(key);
}

bool ChunkSession::knows(const SessionKey& key) const {
    return last_sent_.find(key) != last_sent_.end();
}

uint32_t ChunkSession::times_sent(const SessionKey& key) const {
    auto it = last_sent_.find(key);
    return it != last_sent_.end() ? it->second.times_sent : 0;
}

} // namespace terrastream::server
