#pragma once

#include "protocol/chunk_key.hpp"
#include "protocol/grid.hpp"
#include <cstdint>

namespace terrastream::server {

// Side length of a grid sampled with the given stride: ceil(size / stride)
inline uint32_t sampled_size(uint32_t size, uint32_t stride) {
    return (size + stride - 1) / stride;
}

// Nearest-neighbour downsampling: keeps every stride-th row and column,
// starting at 0. Full LOD returns the native grid unchanged.
// Throws InvalidRequest for lod byte 0.
protocol::Grid sample_lod(const protocol::Grid& native, protocol::LodLevel lod);

} // namespace terrastream::server
