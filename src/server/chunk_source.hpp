#pragma once

#include "protocol/chunk_key.hpp"
#include "protocol/grid.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace terrastream::server {

struct ChunkCoordHash {
    size_t operator()(const protocol::ChunkCoord& c) const {
        return std::hash<int32_t>()(c.cx) ^ (std::hash<int32_t>()(c.cy) << 1);
    }
};

// Where native chunk grids come from. Implementations are shared by every
// connection and must be safe to call concurrently.
class ChunkSource {
public:
    explicit ChunkSource(uint32_t chunk_size) : chunk_size_(chunk_size) {}
    virtual ~ChunkSource() = default;

    // chunk_size() x chunk_size() grid, or a zero grid when nothing is stored
    // for the coordinate. "Not found" is never an error.
    virtual protocol::Grid load_chunk(int32_t cx, int32_t cy) = 0;

    uint32_t chunk_size() const { return chunk_size_; }

protected:
    protocol::Grid empty_chunk() const { return protocol::Grid(chunk_size_); }

private:
    uint32_t chunk_size_;
};

// Reads <dir>/<cx>_<cy>.dat files holding a serialized (uncompressed) grid value
class DirectoryChunkSource : public ChunkSource {
public:
    DirectoryChunkSource(std::string dir, uint32_t chunk_size);

    protocol::Grid load_chunk(int32_t cx, int32_t cy) override;

    // Writes a grid in the format load_chunk reads
    bool save_chunk(int32_t cx, int32_t cy, const protocol::Grid& grid) const;

    std::string path_for(int32_t cx, int32_t cy) const;
    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
};

// In-memory chunk table, replaceable at runtime
class MemoryChunkSource : public ChunkSource {
public:
    explicit MemoryChunkSource(uint32_t chunk_size = protocol::DEFAULT_CHUNK_SIZE);

    protocol::Grid load_chunk(int32_t cx, int32_t cy) override;

    // Returns false (and stores nothing) if the grid is not chunk_size() wide
    bool set_chunk(int32_t cx, int32_t cy, protocol::Grid grid);
    void erase_chunk(int32_t cx, int32_t cy);
    size_t chunk_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<protocol::ChunkCoord, protocol::Grid, ChunkCoordHash> chunks_;
};

} // namespace terrastream::server
