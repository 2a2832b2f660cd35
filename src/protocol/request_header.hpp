#pragma once

#include "protocol/chunk_key.hpp"
#include "protocol/serializable.hpp"
#include <cstdint>

namespace terrastream::protocol {

// Fixed 10-byte client request, integers big-endian:
//   [0]    full_flag  0 = incremental allowed, nonzero = force full payload
//   [1..4] cx         signed chunk x
//   [5..8] cy         signed chunk y
//   [9]    lod_byte   lod = lod_byte / 255
struct RequestHeader : Serializable<RequestHeader> {
    uint8_t full_flag = 1;
    int32_t cx = 0;
    int32_t cy = 0;
    uint8_t lod_byte = LodLevel::FULL;

    static constexpr size_t serialized_size() {
        return sizeof(uint8_t) + sizeof(int32_t) * 2 + sizeof(uint8_t);
    }

    bool force_full() const { return full_flag != 0; }
    ChunkCoord coord() const { return ChunkCoord{cx, cy}; }
    LodLevel lod() const { return LodLevel{lod_byte}; }
    SessionKey key() const { return SessionKey{coord(), lod()}; }

    void serialize_impl(BufferWriter& w) const {
        w.write(full_flag);
        w.write_be(cx);
        w.write_be(cy);
        w.write(lod_byte);
    }

    void deserialize_impl(BufferReader& r) {
        full_flag = r.read<uint8_t>();
        cx = r.read_be<int32_t>();
        cy = r.read_be<int32_t>();
        lod_byte = r.read<uint8_t>();
    }
};

constexpr size_t REQUEST_HEADER_SIZE = RequestHeader::serialized_size();
static_assert(REQUEST_HEADER_SIZE == 10);

} // namespace terrastream::protocol
