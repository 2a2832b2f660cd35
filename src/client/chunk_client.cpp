#include "chunk_client.hpp"
#include "protocol/diff.hpp"
#include "protocol/errors.hpp"
#include "protocol/request_header.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace terrastream::client {

using namespace terrastream::protocol;

ChunkClient::ChunkClient()
    : socket_(io_context_) {
}

ChunkClient::~ChunkClient() {
    disconnect();
}

bool ChunkClient::connect(const std::string& host, uint16_t port) {
    disconnect();
    try {
        tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(host, std::to_string(port));
        asio::connect(socket_, endpoints);
        connected_ = true;
        std::cout << "[ChunkClient] Connected to " << host << ":" << port << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ChunkClient] Connection failed: " << e.what() << std::endl;
        return false;
    }
}

void ChunkClient::disconnect() {
    if (!connected_) return;
    connected_ = false;

    asio::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    // A new connection starts a new server session
    mirror_.clear();
    reader_.clear();
}

const Payload* ChunkClient::mirrored(const SessionKey& key) const {
    auto it = mirror_.find(key);
    return it == mirror_.end() ? nullptr : &it->second;
}

ChunkReply ChunkClient::request(int32_t cx, int32_t cy, double lod, bool force_full) {
    return request(SessionKey{ChunkCoord{cx, cy}, LodLevel::from_fraction(lod)}, force_full);
}

ChunkReply ChunkClient::request(const SessionKey& key, bool force_full) {
    RequestHeader header;
    header.full_flag = force_full ? 1 : 0;
    header.cx = key.coord.cx;
    header.cy = key.coord.cy;
    header.lod_byte = key.lod.byte;

    auto buf = header.to_bytes();
    asio::write(socket_, asio::buffer(buf));

    auto frame = read_frame();

    ChunkReply reply;
    reply.key = key;
    reply.frame_bytes = frame.size();
    reply.payload = decode_frame(frame);

    auto it = mirror_.find(key);
    Payload current;
    if (!force_full && it != mirror_.end()) {
        reply.incremental = true;
        current = apply_delta(it->second, reply.payload);
    } else {
        current = reply.payload;
    }

    try {
        reply.grid = Grid::from_payload(current);
    } catch (const std::invalid_argument& e) {
        throw CorruptFrame(std::string("reply is not a grid: ") + e.what());
    }
    mirror_[key] = std::move(current);
    return reply;
}

std::vector<uint8_t> ChunkClient::read_frame() {
    while (true) {
        if (auto frame = reader_.next_frame()) {
            return std::move(*frame);
        }
        size_t n = socket_.read_some(asio::buffer(read_buffer_));
        reader_.feed(std::span<const uint8_t>(read_buffer_.data(), n));
    }
}

} // namespace terrastream::client
