#include "server/chunk_source.hpp"
#include "server/server.hpp"
#include "server/stream_config.hpp"
#include <asio.hpp>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace terrastream::server;

namespace {

constexpr std::chrono::milliseconds DRAIN_POLL_INTERVAL{100};

// After stop(): poll until every connection has closed or the grace period is over
void drain(asio::steady_timer& timer, Server& server, std::chrono::steady_clock::time_point deadline) {
    if (server.active_connections() == 0) {
        std::cout << "[Main] All connections closed" << std::endl;
        return;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        std::cout << "[Main] Grace period over, closing " << server.active_connections()
                  << " connection(s)" << std::endl;
        server.close_all();
        return;
    }
    timer.expires_after(DRAIN_POLL_INTERVAL);
    timer.async_wait([&timer, &server, deadline](asio::error_code ec) {
        if (!ec) drain(timer, server, deadline);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    StreamConfig config;
    if (!config.load("data/server.json") && !config.load("../data/server.json")) {
        std::cout << "[Main] No server.json found, using defaults" << std::endl;
    }

    try {
        config.apply_arguments(argc, argv);

        asio::io_context io_context;

        auto source = std::make_shared<DirectoryChunkSource>(config.terrain().data_dir, config.terrain().chunk_size);
        Server server(io_context, config, source);

        asio::steady_timer drain_timer(io_context);
        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](asio::error_code ec, int signal) {
            if (ec) return;
            std::cout << "\n[Main] Received signal " << signal << ", shutting down..." << std::endl;
            server.stop();
            auto grace = std::chrono::milliseconds(static_cast<int64_t>(config.server().shutdown_grace * 1000.0f));
            drain(drain_timer, server, std::chrono::steady_clock::now() + grace);
        });

        server.start();

        std::cout << "Terrain stream server running on port " << server.port()
                  << ", tiles from " << config.terrain().data_dir << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        std::vector<std::thread> workers;
        for (int i = 1; i < config.server().io_threads; ++i) {
            workers.emplace_back([&io_context] { io_context.run(); });
        }
        io_context.run();
        for (auto& t : workers) {
            t.join();
        }

        auto stats = server.stats();
        std::cout << "[Main] Served " << stats.requests_served << " request(s) over " << stats.accepted
                  << " connection(s), " << stats.closed_on_error << " closed on error" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
