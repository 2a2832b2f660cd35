#include "server.hpp"
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

namespace terrastream::server {

Server::Server(asio::io_context& io_context, const StreamConfig& config, std::shared_ptr<ChunkSource> source)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), config.server().port))
    , config_(config)
    , source_(std::move(source))
    , port_(acceptor_.local_endpoint().port())
    , admission_(io_context.get_executor(), config.server().max_connections)
    , delivery_(config.delivery())
    , frame_cache_(config.cache().max_entries,
                   std::chrono::milliseconds(static_cast<int64_t>(config.cache().max_age * 1000.0f))) {
}

Server::~Server() {
    stop();
}

void Server::start() {
    running_ = true;
    accept();
    std::cout << "[Server] Streaming " << source_->chunk_size() << "x" << source_->chunk_size()
              << " chunks on port " << port_ << " (max " << admission_.limit() << " connections)" << std::endl;
}

void Server::stop() {
    if (!running_.exchange(false)) return;

    shutdown_.request();
    asio::error_code ec;
    acceptor_.close(ec);
    admission_.cancel_waiters();

    std::cout << "[Server] Shutdown requested, " << active_connections()
              << " connection(s) finishing" << std::endl;
}

void Server::close_all() {
    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [id, weak] : connections_) {
            if (auto conn = weak.lock()) {
                open.push_back(std::move(conn));
            }
        }
    }
    for (auto& conn : open) {
        conn->close();
    }
}

void Server::accept() {
    // Each connection gets its own strand, so io_threads > 1 never runs two
    // handlers of one connection at once
    acceptor_.async_accept(
        asio::make_strand(acceptor_.get_executor()),
        [this](asio::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::shared_ptr<Connection> connection;
                {
                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    uint64_t id = next_connection_id_++;
                    connection = std::make_shared<Connection>(std::move(socket), *this, id);
                    connections_[id] = connection;
                    ++stats_.accepted;
                }
                std::cout << "[Server] New connection " << connection->id() << " from "
                          << connection->peer() << std::endl;
                connection->start();
            } else if (ec != asio::error::operation_aborted) {
                std::cerr << "[Server] Accept error: " << ec.message() << std::endl;
            }

            if (running_) {
                accept();
            }
        });
}

void Server::on_connection_closed(const Connection& connection) {
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(connection.id());
        if (connection.state() == ConnectionState::ClosedOnError) {
            ++stats_.closed_on_error;
        } else {
            ++stats_.closed;
        }
        stats_.requests_served += connection.requests_served();
    }
    std::cout << "[Server] Connection " << connection.id() << " " << state_name(connection.state())
              << " after " << connection.requests_served() << " request(s)" << std::endl;
}

size_t Server::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

ServerStats Server::stats() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return stats_;
}

} // namespace terrastream::server
