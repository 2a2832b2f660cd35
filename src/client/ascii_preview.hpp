#pragma once

#include "protocol/grid.hpp"
#include <cstdint>
#include <string>

namespace terrastream::client {

// One character per cell, 0-9 by elevation tenth (clamped), one line per row.
// Grids wider than max_columns are shown with every n-th row and column.
std::string ascii_preview(const protocol::Grid& grid, uint32_t max_columns = 64);

char elevation_glyph(float value);

} // namespace terrastream::client
