#pragma once

#include "protocol/chunk_key.hpp"
#include "protocol/grid.hpp"
#include <chrono>
#include <cstdint>
#include <unordered_map>

namespace terrastream::server {

struct ChunkSnapshot {
    protocol::Grid grid;
    std::chrono::steady_clock::time_point last_sent;
    uint32_t times_sent = 0;
};

// Last grid delivered on one connection, per (chunk, LOD).
// Owned by exactly one Connection; not thread-safe and never shared.
class ChunkSession {
public:
    explicit ChunkSession(uint64_t connection_id);

    // Grid last delivered for the key, nullptr if this connection never got it
    const protocol::Grid* last_sent(const protocol::SessionKey& key) const;

    void update_last_sent(const protocol::SessionKey& key, protocol::Grid grid);
    void forget(const protocol::SessionKey& key);

    bool knows(const protocol::SessionKey& key) const;
    uint32_t times_sent(const protocol::SessionKey& key) const;

    size_t size() const { return last_sent_.size(); }
    void clear() { last_sent_.clear(); }

    uint64_t connection_id() const { return connection_id_; }

private:
    uint64_t connection_id_;
    std::unordered_map<protocol::SessionKey, ChunkSnapshot, protocol::SessionKeyHash> last_sent_;
};

} // namespace terrastream::server
