#include <catch2/catch_test_macros.hpp>

#include "client/chunk_client.hpp"
#include "protocol/diff.hpp"
#include "protocol/frame.hpp"
#include "protocol/request_header.hpp"
#include "server/chunk_source.hpp"
#include "server/server.hpp"
#include "server/stream_config.hpp"
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace terrastream;
using namespace terrastream::protocol;
using namespace terrastream::server;
using namespace std::chrono_literals;

namespace {

// Server on an ephemeral port with its io_context on a background thread
struct TestServer {
    asio::io_context io;
    StreamConfig config;
    std::shared_ptr<MemoryChunkSource> source;
    std::unique_ptr<Server> server;
    std::vector<std::thread> threads;

    explicit TestServer(size_t max_connections = 16, uint32_t chunk_size = DEFAULT_CHUNK_SIZE, int io_threads = 1) {
        config.server().port = 0;
        config.server().max_connections = max_connections;
        config.terrain().chunk_size = chunk_size;
        config.delivery().retry_base_delay = 0.01f;
        config.delivery().retry_max_delay = 0.05f;
        config.server().io_threads = io_threads;

        source = std::make_shared<MemoryChunkSource>(chunk_size);
        server = std::make_unique<Server>(io, config, source);
        server->start();
        for (int i = 0; i < io_threads; ++i) {
            threads.emplace_back([this] { io.run(); });
        }
    }

    ~TestServer() {
        // Let every connection finish so no slot outlives the server
        asio::post(io, [this] {
            server->stop();
            server->close_all();
        });
        for (auto& t : threads) {
            t.join();
        }
    }

    void run_on_server(std::function<void()> fn) {
        std::promise<void> done;
        asio::post(io, [&] {
            fn();
            done.set_value();
        });
        done.get_future().wait();
    }

    uint16_t port() const { return server->port(); }
};

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

std::array<uint8_t, REQUEST_HEADER_SIZE> header_bytes(bool full, int32_t cx, int32_t cy, uint8_t lod) {
    RequestHeader header;
    header.full_flag = full ? 1 : 0;
    header.cx = cx;
    header.cy = cy;
    header.lod_byte = lod;
    return header.to_bytes();
}

// Reads exactly one length-prefixed frame from a blocking socket
std::vector<uint8_t> read_raw_frame(asio::ip::tcp::socket& socket) {
    std::vector<uint8_t> frame(FRAME_LENGTH_SIZE);
    asio::read(socket, asio::buffer(frame));
    uint32_t length = (uint32_t{frame[0]} << 24) | (uint32_t{frame[1]} << 16)
                    | (uint32_t{frame[2]} << 8) | uint32_t{frame[3]};
    frame.resize(FRAME_LENGTH_SIZE + length);
    asio::read(socket, asio::buffer(frame.data() + FRAME_LENGTH_SIZE, length));
    return frame;
}

// Pseudo-random cells that deflate poorly
Grid noise(uint32_t size) {
    Grid g(size);
    uint32_t state = 12345;
    for (uint32_t r = 0; r < size; ++r) {
        for (uint32_t c = 0; c < size; ++c) {
            state = state * 1664525u + 1013904223u;
            g.set(r, c, static_cast<float>(state >> 8) / 16777216.0f);
        }
    }
    return g;
}

Grid ramp(uint32_t size) {
    Grid g(size);
    for (uint32_t r = 0; r < size; ++r) {
        for (uint32_t c = 0; c < size; ++c) {
            g.set(r, c, static_cast<float>(r + c) / (2.0f * size));
        }
    }
    return g;
}

} // namespace

TEST_CASE("Full request against an empty source returns a zero grid", "[server][loopback]") {
    TestServer ts;

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect({asio::ip::address_v4::loopback(), ts.port()});
    asio::write(socket, asio::buffer(header_bytes(true, 0, 0, 255)));

    Payload payload = decode_frame(read_raw_frame(socket));
    Grid grid = Grid::from_payload(payload);
    REQUIRE(grid.size() == 128);
    REQUIRE(grid == Grid(128));
}

TEST_CASE("Second request carries only the changed row", "[server][loopback]") {
    TestServer ts;
    Grid original = ramp(128);
    REQUIRE(ts.source->set_chunk(0, 0, original));

    client::ChunkClient chunk_client;
    REQUIRE(chunk_client.connect("127.0.0.1", ts.port()));

    auto first = chunk_client.request(0, 0, 1.0, true);
    REQUIRE_FALSE(first.incremental);
    REQUIRE(first.grid == original);

    Grid changed = original;
    changed.set(3, 5, 0.99f);
    REQUIRE(ts.source->set_chunk(0, 0, changed));

    auto second = chunk_client.request(0, 0, 1.0, false);
    REQUIRE(second.incremental);
    REQUIRE(second.payload.is_array());
    REQUIRE(delta_entry_count(second.payload) == 1);
    REQUIRE(second.payload[0][DELTA_INDEX_KEY] == 3);
    REQUIRE(second.grid == changed);
    REQUIRE(second.frame_bytes < first.frame_bytes);

    auto third = chunk_client.request(0, 0, 1.0, false);
    REQUIRE(is_no_change(third.payload));
    REQUIRE(third.grid == changed);
}

TEST_CASE("Sessions are per connection and per LOD", "[server][loopback]") {
    TestServer ts(16, 16);
    REQUIRE(ts.source->set_chunk(2, -1, ramp(16)));

    client::ChunkClient a;
    client::ChunkClient b;
    REQUIRE(a.connect("127.0.0.1", ts.port()));
    REQUIRE(b.connect("127.0.0.1", ts.port()));

    REQUIRE_FALSE(a.request(2, -1, 1.0, false).incremental);
    REQUIRE(a.request(2, -1, 1.0, false).incremental);

    // b has never seen the chunk, so its first reply is full
    auto b_first = b.request(2, -1, 1.0, false);
    REQUIRE(b_first.grid == ramp(16));

    auto a_half = a.request(SessionKey{ChunkCoord{2, -1}, LodLevel{127}}, false);
    REQUIRE(a_half.grid.size() == 8);
    REQUIRE(a_half.payload == a_half.grid.to_payload());

    REQUIRE(ts.server->frame_cache().hits() >= 1);

    REQUIRE(a.mirrored_chunks() == 2);
    REQUIRE(b.mirrored_chunks() == 1);
    REQUIRE(a.mirrored(SessionKey{ChunkCoord{2, -1}, LodLevel{127}}) != nullptr);
    REQUIRE(b.mirrored(SessionKey{ChunkCoord{2, -1}, LodLevel{127}}) == nullptr);

    a.disconnect();
    REQUIRE(a.mirrored_chunks() == 0);
}

TEST_CASE("Connections beyond the limit wait for a free slot", "[server][loopback][admission]") {
    TestServer ts(16, 8);

    std::vector<std::unique_ptr<client::ChunkClient>> admitted;
    for (int i = 0; i < 16; ++i) {
        auto c = std::make_unique<client::ChunkClient>();
        REQUIRE(c->connect("127.0.0.1", ts.port()));
        REQUIRE(c->request(0, 0, 1.0, true).grid.size() == 8);
        admitted.push_back(std::move(c));
    }
    REQUIRE(ts.server->admission().in_use() == 16);

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect({asio::ip::address_v4::loopback(), ts.port()});
    asio::write(socket, asio::buffer(header_bytes(true, 0, 0, 255)));

    std::vector<uint8_t> prefix(FRAME_LENGTH_SIZE);
    bool answered = false;
    asio::async_read(socket, asio::buffer(prefix), [&](asio::error_code ec, std::size_t) {
        answered = !ec;
    });

    io.run_for(300ms);
    REQUIRE_FALSE(answered);
    REQUIRE(wait_until([&] { return ts.server->admission().waiting() == 1; }));

    admitted.front()->disconnect();

    io.restart();
    io.run_for(2000ms);
    REQUIRE(answered);
}

TEST_CASE("Truncated header then close is a clean disconnect", "[server][loopback]") {
    TestServer ts;

    {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        socket.connect({asio::ip::address_v4::loopback(), ts.port()});
        std::array<uint8_t, 3> partial{0x01, 0x00, 0x00};
        asio::write(socket, asio::buffer(partial));
        socket.close();
    }

    REQUIRE(wait_until([&] { return ts.server->stats().closed == 1; }));
    REQUIRE(ts.server->stats().closed_on_error == 0);
    REQUIRE(wait_until([&] { return ts.server->admission().in_use() == 0; }));
    REQUIRE(ts.server->active_connections() == 0);
}

TEST_CASE("LOD byte 0 closes the connection on error", "[server][loopback]") {
    TestServer ts;

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect({asio::ip::address_v4::loopback(), ts.port()});
    asio::write(socket, asio::buffer(header_bytes(true, 0, 0, 0)));

    std::array<uint8_t, 1> byte{};
    asio::error_code ec;
    asio::read(socket, asio::buffer(byte), ec);
    REQUIRE(ec);

    REQUIRE(wait_until([&] { return ts.server->stats().closed_on_error == 1; }));
    REQUIRE(ts.server->admission().in_use() == 0);
}

TEST_CASE("Shutdown lets the current request finish, then closes", "[server][loopback][shutdown]") {
    TestServer ts(16, 8);

    client::ChunkClient chunk_client;
    REQUIRE(chunk_client.connect("127.0.0.1", ts.port()));
    REQUIRE(chunk_client.request(0, 0, 1.0, true).grid.size() == 8);

    ts.run_on_server([&] { ts.server->stop(); });
    REQUIRE_FALSE(ts.server->running());

    // Already waiting on this header when shutdown was requested
    REQUIRE(chunk_client.request(0, 0, 1.0, false).incremental);
    REQUIRE_THROWS(chunk_client.request(0, 0, 1.0, false));

    REQUIRE(wait_until([&] { return ts.server->active_connections() == 0; }));
    REQUIRE(ts.server->stats().closed == 1);

    client::ChunkClient late;
    REQUIRE_FALSE(late.connect("127.0.0.1", ts.port()));
}

TEST_CASE("Exhausted delivery retries close the connection on error", "[server][loopback][delivery]") {
    // Frame far larger than the loopback socket buffers, so the peer's reset
    // lands before the server has finished writing it
    constexpr uint32_t size = 2048;
    TestServer ts(16, size);
    REQUIRE(ts.source->set_chunk(0, 0, noise(size)));

    {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        socket.connect({asio::ip::address_v4::loopback(), ts.port()});
        asio::write(socket, asio::buffer(header_bytes(true, 0, 0, 255)));

        // The frame cache is consulted once the header has been read
        REQUIRE(wait_until([&] { return ts.server->frame_cache().misses() >= 1; }, 10000ms));
        socket.set_option(asio::socket_base::linger(true, 0));
        socket.close();
    }

    REQUIRE(wait_until([&] { return ts.server->stats().closed_on_error == 1; }, 20000ms));
    auto stats = ts.server->stats();
    REQUIRE(stats.closed == 0);
    REQUIRE(stats.requests_served == 0);
    REQUIRE(ts.server->admission().in_use() == 0);
    REQUIRE(ts.server->active_connections() == 0);
}

TEST_CASE("Concurrent clients are served correctly by several io threads", "[server][loopback]") {
    TestServer ts(16, 16, 4);
    REQUIRE(ts.source->set_chunk(0, 0, ramp(16)));

    std::atomic<int> consistent{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < 6; ++i) {
        clients.emplace_back([&] {
            client::ChunkClient c;
            if (!c.connect("127.0.0.1", ts.port())) return;
            bool ok = true;
            try {
                for (int n = 0; n < 20; ++n) {
                    auto reply = c.request(0, 0, n % 2 == 0 ? 1.0 : 0.5, false);
                    ok = ok && reply.incremental == (n >= 2) && reply.grid.size() == (n % 2 == 0 ? 16u : 8u);
                }
            } catch (const std::exception&) {
                ok = false;
            }
            if (ok) ++consistent;
        });
    }
    for (auto& t : clients) {
        t.join();
    }
    REQUIRE(consistent == 6);
}

TEST_CASE("Force-closing connections spread over several io threads", "[server][loopback][shutdown]") {
    TestServer ts(16, 8, 4);

    std::vector<std::unique_ptr<client::ChunkClient>> clients;
    for (int i = 0; i < 8; ++i) {
        auto c = std::make_unique<client::ChunkClient>();
        REQUIRE(c->connect("127.0.0.1", ts.port()));
        REQUIRE(c->request(0, 0, 1.0, true).grid.size() == 8);
        clients.push_back(std::move(c));
    }
    REQUIRE(ts.server->active_connections() == 8);

    // Every connection is waiting on its next header; close from a foreign thread
    ts.server->close_all();

    REQUIRE(wait_until([&] { return ts.server->active_connections() == 0; }));
    auto stats = ts.server->stats();
    REQUIRE(stats.closed == 8);
    REQUIRE(stats.closed_on_error == 0);
    REQUIRE(stats.requests_served == 8);
    REQUIRE(ts.server->admission().in_use() == 0);

    for (auto& c : clients) {
        REQUIRE_THROWS(c->request(0, 0, 1.0, false));
    }
}
