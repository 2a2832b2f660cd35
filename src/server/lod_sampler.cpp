#include "lod_sampler.hpp"
#include <utility>
#include <vector>

namespace terrastream::server {

using namespace terrastream::protocol;

Grid sample_lod(const Grid& native, LodLevel lod) {
    uint32_t stride = lod.stride(native.size());
    if (stride == 1) {
        return native;
    }

    uint32_t out_size = sampled_size(native.size(), stride);
    std::vector<float> cells;
    cells.reserve(static_cast<size_t>(out_size) * out_size);
    for (uint32_t row = 0; row < native.size(); row += stride) {
        for (uint32_t col = 0; col < native.size(); col += stride) {
            cells.push_back(native.at(row, col));
        }
    }
    return Grid(out_size, std::move(cells));
}

} // namespace terrastream::server
