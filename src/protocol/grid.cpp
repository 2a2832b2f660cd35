#include "grid.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace terrastream::protocol {

Grid::Grid(uint32_t size)
    : size_(size)
    , cells_(static_cast<size_t>(size) * size, 0.0f) {
}

Grid::Grid(uint32_t size, std::vector<float> cells)
    : size_(size)
    , cells_(std::move(cells)) {
    if (cells_.size() != static_cast<size_t>(size) * size) {
        throw std::invalid_argument("Grid: " + std::to_string(cells_.size())
                                    + " cells for side " + std::to_string(size));
    }
}

Payload Grid::to_payload() const {
    Payload rows = Payload::array();
    for (uint32_t r = 0; r < size_; ++r) {
        Payload row = Payload::array();
        for (uint32_t c = 0; c < size_; ++c) {
            row.push_back(static_cast<double>(at(r, c)));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

Grid Grid::from_payload(const Payload& payload) {
    if (!payload.is_array()) {
        throw std::invalid_argument(std::string("Grid: expected array of rows, got ") + payload.type_name());
    }
    if (payload.size() > MAX_GRID_SIZE) {
        throw std::invalid_argument("Grid: side " + std::to_string(payload.size()) + " too large");
    }

    auto size = static_cast<uint32_t>(payload.size());
    std::vector<float> cells;
    cells.reserve(static_cast<size_t>(size) * size);
    for (uint32_t r = 0; r < size; ++r) {
        const Payload& row = payload[r];
        if (!row.is_array() || row.size() != size) {
            throw std::invalid_argument("Grid: row " + std::to_string(r) + " is not " + std::to_string(size) + " wide");
        }
        for (const auto& cell : row) {
            if (!cell.is_number()) {
                throw std::invalid_argument("Grid: non-numeric cell in row " + std::to_string(r));
            }
            cells.push_back(static_cast<float>(cell.get<double>()));
        }
    }
    return Grid(size, std::move(cells));
}

} // namespace terrastream::protocol
