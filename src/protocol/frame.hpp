#pragma once

#include "protocol/payload.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace terrastream::protocol {

// Frame layout: [u32 big-endian length L][L bytes of deflate(msgpack(payload))]
constexpr size_t FRAME_LENGTH_SIZE = 4;

constexpr int DEFAULT_COMPRESSION_LEVEL = 6;

// Returned by find_frame_boundary while a frame is still being received
constexpr std::ptrdiff_t FRAME_INCOMPLETE = -1;

// Ceiling on the inflated payload; a packed 4096^2 float64 grid stays well below it
constexpr size_t MAX_INFLATED_SIZE = 256u * 1024u * 1024u;

// Pack as MessagePack, compress at the given zlib level (1-9) and length-prefix
std::vector<uint8_t> encode_frame(const Payload& payload, int compression_level = DEFAULT_COMPRESSION_LEVEL);

// Offset just past the first complete frame in buffer, or FRAME_INCOMPLETE
std::ptrdiff_t find_frame_boundary(std::span<const uint8_t> buffer);

// Inverse of encode_frame; the span must hold exactly one frame.
// Throws CorruptFrame on a length mismatch, inflate failure or bad MessagePack.
Payload decode_frame(std::span<const uint8_t> frame);

std::vector<uint8_t> deflate_bytes(std::span<const uint8_t> data, int level);
std::vector<uint8_t> inflate_bytes(std::span<const uint8_t> data, size_t max_size = MAX_INFLATED_SIZE);

// Accumulates stream bytes and hands off one complete frame at a time
class FrameReader {
public:
    void feed(std::span<const uint8_t> bytes);

    // Next complete frame (length prefix included), or nullopt if more bytes are needed
    std::optional<std::vector<uint8_t>> next_frame();

    size_t buffered() const { return buffer_.size(); }
    void clear() { buffer_.clear(); }

private:
    std::vector<uint8_t> buffer_;
};

} // namespace terrastream::protocol
