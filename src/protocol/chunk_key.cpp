#include "chunk_key.hpp"
#include "protocol/errors.hpp"

namespace terrastream::protocol {

uint32_t LodLevel::stride(uint32_t chunk_size) const {
    if (byte == 0) {
        throw InvalidRequest("lod byte 0 has no sampling stride");
    }
    if (is_full()) return 1;
    uint32_t factor = FULL / byte;
    return std::max(1u, std::min(factor, chunk_size));
}

} // namespace terrastream::protocol
