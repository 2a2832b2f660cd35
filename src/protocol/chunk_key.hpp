#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace terrastream::protocol {

struct ChunkCoord {
    int32_t cx = 0;
    int32_t cy = 0;

    bool operator==(const ChunkCoord& other) const {
        return cx == other.cx && cy == other.cy;
    }
};

/**
 * Level of detail as it travels on the wire: one byte, lod = byte / 255.
 *
 * 255 is full resolution. Anything lower samples every stride-th row and
 * column, stride = floor(1 / lod) = floor(255 / byte). Byte 0 has no stride
 * and is rejected by stride().
 */
struct LodLevel {
    static constexpr uint8_t FULL = 255;

    uint8_t byte = FULL;

    // Nearest byte at or below the fraction, clamped to [1, 255]
    static LodLevel from_fraction(double lod) {
        double clamped = std::clamp(lod, 0.0, 1.0);
        auto b = static_cast<int>(clamped * FULL);
        return LodLevel{static_cast<uint8_t>(std::max(b, 1))};
    }

    double fraction() const { return byte / static_cast<double>(FULL); }
    bool is_full() const { return byte == FULL; }

    // Throws InvalidRequest for byte 0. Never exceeds chunk_size.
    uint32_t stride(uint32_t chunk_size) const;

    bool operator==(const LodLevel& other) const { return byte == other.byte; }
};

// Session cache key: the same chunk at two LODs is cached independently
struct SessionKey {
    ChunkCoord coord;
    LodLevel lod;

    bool operator==(const SessionKey& other) const {
        return coord == other.coord && lod == other.lod;
    }
};

struct SessionKeyHash {
    size_t operator()(const SessionKey& key) const {
        size_t h = std::hash<int32_t>()(key.coord.cx);
        h ^= std::hash<int32_t>()(key.coord.cy) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<uint8_t>()(key.lod.byte) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace terrastream::protocol
