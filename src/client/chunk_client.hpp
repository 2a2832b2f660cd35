#pragma once

#include "protocol/chunk_key.hpp"
#include "protocol/frame.hpp"
#include "protocol/grid.hpp"
#include "protocol/payload.hpp"
#include <asio.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace terrastream::client {

struct ChunkReply {
    protocol::SessionKey key;
    protocol::Payload payload; // as received: a full grid or a delta
    protocol::Grid grid;       // reconstructed chunk at the requested LOD
    bool incremental = false;
    size_t frame_bytes = 0;    // compressed size on the wire, prefix included
};

// Blocking client for the chunk stream. Keeps a mirror of the last grid it
// received per (chunk, LOD) so incremental replies can be applied locally.
class ChunkClient {
public:
    using tcp = asio::ip::tcp;

    ChunkClient();
    ~ChunkClient();

    bool connect(const std::string& host, uint16_t port);
    void disconnect();
    bool is_connected() const { return connected_; }

    // Sends one request and waits for its reply. A payload is read as a delta
    // only when force_full is false and the mirror already holds this key.
    // Throws asio::system_error on a transport failure and CorruptFrame on a bad frame.
    ChunkReply request(int32_t cx, int32_t cy, double lod, bool force_full = false);
    ChunkReply request(const protocol::SessionKey& key, bool force_full = false);

    size_t mirrored_chunks() const { return mirror_.size(); }
    const protocol::Payload* mirrored(const protocol::SessionKey& key) const;

private:
    std::vector<uint8_t> read_frame();

    asio::io_context io_context_;
    tcp::socket socket_;
    bool connected_ = false;

    protocol::FrameReader reader_;
    std::array<uint8_t, 64 * 1024> read_buffer_{};
    std::unordered_map<protocol::SessionKey, protocol::Payload, protocol::SessionKeyHash> mirror_;
};

} // namespace terrastream::client
