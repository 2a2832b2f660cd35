#pragma once

#include "server/admission_controller.hpp"
#include "server/chunk_source.hpp"
#include "server/connection.hpp"
#include "server/delivery.hpp"
#include "server/frame_cache.hpp"
#include "server/shutdown.hpp"
#include "server/stream_config.hpp"
#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace terrastream::server {

struct ServerStats {
    uint64_t accepted = 0;
    uint64_t closed = 0;
    uint64_t closed_on_error = 0;
    uint64_t requests_served = 0;  // responses delivered by connections that have closed
};

class Server {
public:
    using tcp = asio::ip::tcp;

    // Binds immediately; port 0 in the config picks an ephemeral port
    Server(asio::io_context& io_context, const StreamConfig& config, std::shared_ptr<ChunkSource> source);
    ~Server();

    void start();

    // Stop accepting and ask connections to finish their current request
    void stop();

    // Force-close every remaining connection (end of the shutdown grace period)
    void close_all();

    uint16_t port() const { return port_; }
    bool running() const { return running_; }
    size_t active_connections() const;
    ServerStats stats() const;

    void on_connection_closed(const Connection& connection);

    const StreamConfig& config() const { return config_; }
    ChunkSource& source() { return *source_; }
    AdmissionController& admission() { return admission_; }
    DeliveryEngine& delivery() { return delivery_; }
    FrameCache& frame_cache() { return frame_cache_; }
    const ShutdownFlag& shutdown_flag() const { return shutdown_; }

private:
    void accept();

    tcp::acceptor acceptor_;
    const StreamConfig& config_;
    std::shared_ptr<ChunkSource> source_;
    uint16_t port_ = 0;

    AdmissionController admission_;
    DeliveryEngine delivery_;
    FrameCache frame_cache_;
    ShutdownFlag shutdown_;

    std::unordered_map<uint64_t, std::weak_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;
    uint64_t next_connection_id_ = 1;
    ServerStats stats_;

    std::atomic<bool> running_{false};
};

} // namespace terrastream::server
