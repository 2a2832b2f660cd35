#include "frame.hpp"
#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include "protocol/errors.hpp"
#include <zlib.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace terrastream::protocol {

std::vector<uint8_t> deflate_bytes(std::span<const uint8_t> data, int level) {
    if (level < Z_BEST_SPEED || level > Z_BEST_COMPRESSION) {
        throw std::invalid_argument("compression level " + std::to_string(level) + " outside 1-9");
    }

    uLongf dest_len = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> out(dest_len);
    int rc = compress2(out.data(), &dest_len, data.data(), static_cast<uLong>(data.size()), level);
    if (rc != Z_OK) {
        throw std::runtime_error("compress2 failed with code " + std::to_string(rc));
    }
    out.resize(dest_len);
    return out;
}

std::vector<uint8_t> inflate_bytes(std::span<const uint8_t> data, size_t max_size) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("inflateInit failed");
    }

    std::vector<uint8_t> out;
    out.resize(std::min<size_t>(std::max<size_t>(data.size() * 4, 1024), max_size));

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (stream.total_out == out.size()) {
            if (out.size() >= max_size) {
                inflateEnd(&stream);
                throw CorruptFrame("inflated payload exceeds " + std::to_string(max_size) + " bytes");
            }
            out.resize(std::min(out.size() * 2, max_size));
        }
        stream.next_out = out.data() + stream.total_out;
        stream.avail_out = static_cast<uInt>(out.size() - stream.total_out);

        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) break;
        if (rc != Z_OK) {
            // Z_BUF_ERROR with a full output buffer only means the buffer must grow
            if (rc == Z_BUF_ERROR && stream.avail_out == 0) continue;
            std::string msg = stream.msg ? stream.msg : ("zlib code " + std::to_string(rc));
            inflateEnd(&stream);
            throw CorruptFrame("inflate failed: " + msg);
        }
        if (stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            throw CorruptFrame("inflate failed: truncated deflate stream");
        }
    }

    bool trailing = stream.avail_in != 0;
    out.resize(stream.total_out);
    inflateEnd(&stream);
    if (trailing) {
        throw CorruptFrame("trailing bytes after deflate stream");
    }
    return out;
}

std::vector<uint8_t> encode_frame(const Payload& payload, int compression_level) {
    std::vector<uint8_t> packed = Payload::to_msgpack(payload);
    std::vector<uint8_t> compressed = deflate_bytes(packed, compression_level);
    if (compressed.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("frame payload exceeds 32-bit length prefix");
    }

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_LENGTH_SIZE + compressed.size());
    BufferWriter w(frame);
    w.write_be(static_cast<uint32_t>(compressed.size()));
    w.write_bytes(compressed);
    return frame;
}

std::ptrdiff_t find_frame_boundary(std::span<const uint8_t> buffer) {
    if (buffer.size() < FRAME_LENGTH_SIZE) {
        return FRAME_INCOMPLETE;
    }
    BufferReader r(buffer);
    uint64_t length = r.read_be<uint32_t>();
    if (length > buffer.size() - FRAME_LENGTH_SIZE) {
        return FRAME_INCOMPLETE;
    }
    return static_cast<std::ptrdiff_t>(FRAME_LENGTH_SIZE + length);
}

Payload decode_frame(std::span<const uint8_t> frame) {
    if (frame.size() < FRAME_LENGTH_SIZE) {
        throw CorruptFrame("frame shorter than its length prefix");
    }
    BufferReader r(frame);
    uint32_t length = r.read_be<uint32_t>();
    if (length != frame.size() - FRAME_LENGTH_SIZE) {
        throw CorruptFrame("length prefix " + std::to_string(length) + " but "
                           + std::to_string(frame.size() - FRAME_LENGTH_SIZE) + " payload bytes");
    }
    std::vector<uint8_t> packed = inflate_bytes(r.remaining());
    try {
        return Payload::from_msgpack(packed);
    } catch (const Payload::exception& e) {
        throw CorruptFrame(std::string("bad MessagePack payload: ") + e.what());
    }
}

void FrameReader::feed(std::span<const uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::optional<std::vector<uint8_t>> FrameReader::next_frame() {
    std::ptrdiff_t end = find_frame_boundary(buffer_);
    if (end == FRAME_INCOMPLETE) {
        return std::nullopt;
    }
    std::vector<uint8_t> frame(buffer_.begin(), buffer_.begin() + end);
    buffer_.erase(buffer_.begin(), buffer_.begin() + end);
    return frame;
}

} // namespace terrastream::protocol
