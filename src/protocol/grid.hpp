#pragma once
/**
 * Elevation grid - shared between client and server.
 *
 * A chunk is a square grid of float elevations stored row-major. Native
 * chunks are chunk_size x chunk_size (128 by default); LOD sampling
 * produces smaller square grids.
 */

#include "protocol/payload.hpp"
#include <cstdint>
#include <vector>

namespace terrastream::protocol {

constexpr uint32_t DEFAULT_CHUNK_SIZE = 128;

// Largest side length accepted when decoding a grid from a frame or a file
constexpr uint32_t MAX_GRID_SIZE = 4096;

class Grid {
public:
    Grid() = default;

    // Zero-filled size x size grid
    explicit Grid(uint32_t size);

    Grid(uint32_t size, std::vector<float> cells);

    uint32_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    float at(uint32_t row, uint32_t col) const { return cells_[row * size_ + col]; }
    void set(uint32_t row, uint32_t col, float value) { cells_[row * size_ + col] = value; }

    const std::vector<float>& cells() const { return cells_; }

    // Nested array of rows of doubles; the wire shape of a full payload
    Payload to_payload() const;

    // Throws std::invalid_argument if the payload is not a square array of numeric rows
    static Grid from_payload(const Payload& payload);

    bool operator==(const Grid& other) const {
        return size_ == other.size_ && cells_ == other.cells_;
    }
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    uint32_t size_ = 0;
    std::vector<float> cells_;
};

} // namespace terrastream::protocol
