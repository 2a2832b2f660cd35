#include "ascii_preview.hpp"
#include <algorithm>
#include <cmath>

namespace terrastream::client {

char elevation_glyph(float value) {
    if (std::isnan(value)) return '?';
    float scaled = std::floor(value * 10.0f);
    int digit = static_cast<int>(std::clamp(scaled, 0.0f, 9.0f));
    return static_cast<char>('0' + digit);
}

std::string ascii_preview(const protocol::Grid& grid, uint32_t max_columns) {
    std::string out;
    if (grid.empty()) return out;

    uint32_t step = 1;
    if (max_columns > 0 && grid.size() > max_columns) {
        step = (grid.size() + max_columns - 1) / max_columns;
    }

    for (uint32_t row = 0; row < grid.size(); row += step) {
        for (uint32_t col = 0; col < grid.size(); col += step) {
            out += elevation_glyph(grid.at(row, col));
        }
        out += '\n';
    }
    return out;
}

} // namespace terrastream::client
