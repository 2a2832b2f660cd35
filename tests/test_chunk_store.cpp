#include <catch2/catch_test_macros.hpp>

#include "protocol/diff.hpp"
#include "protocol/errors.hpp"
#include "server/chunk_session.hpp"
#include "server/chunk_source.hpp"
#include "server/frame_cache.hpp"
#include "server/request_processor.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace terrastream::protocol;
using namespace terrastream::server;

namespace {

Grid filled(uint32_t size, float value) {
    return Grid(size, std::vector<float>(static_cast<size_t>(size) * size, value));
}

// Scratch directory removed when the test ends
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("terrastream_" + name)) {
        std::filesystem::remove_all(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

RequestHeader header_for(int32_t cx, int32_t cy, uint8_t lod, bool full) {
    RequestHeader h;
    h.full_flag = full ? 1 : 0;
    h.cx = cx;
    h.cy = cy;
    h.lod_byte = lod;
    return h;
}

} // namespace

TEST_CASE("MemoryChunkSource returns a zero grid for unknown chunks", "[source]") {
    MemoryChunkSource source(16);
    Grid g = source.load_chunk(99, -4);
    REQUIRE(g == Grid(16));
}

TEST_CASE("MemoryChunkSource stores only chunk-sized grids", "[source]") {
    MemoryChunkSource source(8);
    REQUIRE(source.set_chunk(1, 2, filled(8, 0.5f)));
    REQUIRE_FALSE(source.set_chunk(1, 3, filled(4, 0.5f)));
    REQUIRE(source.chunk_count() == 1);
    REQUIRE(source.load_chunk(1, 2) == filled(8, 0.5f));

    source.erase_chunk(1, 2);
    REQUIRE(source.load_chunk(1, 2) == Grid(8));
}

TEST_CASE("DirectoryChunkSource reads what it saves", "[source]") {
    TempDir dir("dir_source_roundtrip");
    DirectoryChunkSource source(dir.path.string(), 8);

    Grid g(8);
    g.set(0, 7, 0.125f);
    g.set(5, 2, 0.875f);
    REQUIRE(source.save_chunk(-3, 4, g));
    REQUIRE(std::filesystem::exists(source.path_for(-3, 4)));
    REQUIRE(source.path_for(-3, 4).find("-3_4.dat") != std::string::npos);

    REQUIRE(source.load_chunk(-3, 4) == g);

    std::ifstream f(source.path_for(-3, 4), std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(Payload::from_msgpack(bytes) == g.to_payload());
}

TEST_CASE("DirectoryChunkSource loads MessagePack tiles of float64 rows", "[source]") {
    TempDir dir("dir_source_msgpack");
    DirectoryChunkSource source(dir.path.string(), 2);
    std::filesystem::create_directories(dir.path);

    // float64 cells, as numpy-derived tiles are usually packed
    std::vector<uint8_t> packed{0x92,
                                0x92, 0xcb, 0x3f, 0xe0, 0, 0, 0, 0, 0, 0, 0xcb, 0, 0, 0, 0, 0, 0, 0, 0,
                                0x92, 0xcb, 0x3f, 0xd0, 0, 0, 0, 0, 0, 0, 0xcb, 0x3f, 0xf0, 0, 0, 0, 0, 0, 0};
    std::ofstream(source.path_for(0, 1), std::ios::binary)
        .write(reinterpret_cast<const char*>(packed.data()), static_cast<std::streamsize>(packed.size()));

    Grid expected(2, {0.5f, 0.0f, 0.25f, 1.0f});
    REQUIRE(source.load_chunk(0, 1) == expected);
}

TEST_CASE("DirectoryChunkSource falls back to a zero grid", "[source]") {
    TempDir dir("dir_source_fallback");
    DirectoryChunkSource source(dir.path.string(), 8);

    SECTION("missing file") {
        REQUIRE(source.load_chunk(0, 0) == Grid(8));
    }
    SECTION("corrupt file") {
        std::filesystem::create_directories(dir.path);
        std::ofstream(source.path_for(1, 1), std::ios::binary) << "not a grid";
        REQUIRE(source.load_chunk(1, 1) == Grid(8));
    }
    SECTION("wrong size") {
        DirectoryChunkSource small(dir.path.string(), 4);
        REQUIRE(small.save_chunk(2, 2, filled(4, 1.0f)));
        REQUIRE(source.load_chunk(2, 2) == Grid(8));
    }
}

TEST_CASE("ChunkSession tracks the last grid per chunk and LOD", "[session]") {
    ChunkSession session(7);
    SessionKey full{ChunkCoord{0, 0}, LodLevel{255}};
    SessionKey half{ChunkCoord{0, 0}, LodLevel{127}};

    REQUIRE(session.last_sent(full) == nullptr);
    REQUIRE(session.connection_id() == 7);

    session.update_last_sent(full, filled(4, 1.0f));
    REQUIRE(session.knows(full));
    REQUIRE_FALSE(session.knows(half));
    REQUIRE(*session.last_sent(full) == filled(4, 1.0f));

    session.update_last_sent(full, filled(4, 2.0f));
    REQUIRE(*session.last_sent(full) == filled(4, 2.0f));
    REQUIRE(session.times_sent(full) == 2);
    REQUIRE(session.size() == 1);

    session.forget(full);
    REQUIRE(session.last_sent(full) == nullptr);
}

TEST_CASE("FrameCache serves a frame only for an identical grid", "[cache]") {
    FrameCache cache(4, std::chrono::seconds(60));
    SessionKey key{ChunkCoord{1, 1}, LodLevel{255}};
    auto frame = std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>{1, 2, 3});

    REQUIRE(cache.find(key, filled(4, 0.5f)) == nullptr);
    cache.store(key, filled(4, 0.5f), frame);

    REQUIRE(cache.find(key, filled(4, 0.5f)) == frame);
    REQUIRE(cache.find(key, filled(4, 0.25f)) == nullptr);
    REQUIRE(cache.hits() == 1);
    REQUIRE(cache.misses() == 2);
}

TEST_CASE("FrameCache evicts by age and by count", "[cache]") {
    using namespace std::chrono_literals;
    auto t0 = FrameCache::Clock::now();
    auto frame = std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>{9});

    SECTION("expired entries are dropped") {
        FrameCache cache(4, 1000ms);
        SessionKey key{ChunkCoord{0, 0}, LodLevel{255}};
        cache.store(key, Grid(2), frame, t0);
        REQUIRE(cache.find(key, Grid(2), t0 + 500ms) == frame);
        REQUIRE(cache.find(key, Grid(2), t0 + 1500ms) == nullptr);
        REQUIRE(cache.size() == 0);
    }
    SECTION("least recently used goes first") {
        FrameCache cache(2, 1000ms);
        SessionKey a{ChunkCoord{0, 0}, LodLevel{255}};
        SessionKey b{ChunkCoord{1, 0}, LodLevel{255}};
        SessionKey c{ChunkCoord{2, 0}, LodLevel{255}};
        cache.store(a, Grid(2), frame, t0);
        cache.store(b, Grid(2), frame, t0);
        REQUIRE(cache.find(a, Grid(2), t0) == frame);
        cache.store(c, Grid(2), frame, t0);

        REQUIRE(cache.size() == 2);
        REQUIRE(cache.find(b, Grid(2), t0) == nullptr);
        REQUIRE(cache.find(a, Grid(2), t0) == frame);
        REQUIRE(cache.find(c, Grid(2), t0) == frame);
    }
    SECTION("zero entries disables the cache") {
        FrameCache cache(0, 1000ms);
        SessionKey key{ChunkCoord{0, 0}, LodLevel{255}};
        cache.store(key, Grid(2), frame, t0);
        REQUIRE_FALSE(cache.enabled());
        REQUIRE(cache.find(key, Grid(2), t0) == nullptr);
    }
}

TEST_CASE("prepare_response sends a full grid on first request", "[processor]") {
    MemoryChunkSource source(8);
    REQUIRE(source.set_chunk(0, 0, filled(8, 0.5f)));
    ChunkSession session(1);

    auto response = prepare_response(header_for(0, 0, 255, false), session, source);
    REQUIRE_FALSE(response.incremental);
    REQUIRE(response.grid == filled(8, 0.5f));
    REQUIRE(response.payload == filled(8, 0.5f).to_payload());
}

TEST_CASE("prepare_response diffs against the session entry", "[processor]") {
    MemoryChunkSource source(8);
    REQUIRE(source.set_chunk(0, 0, filled(8, 0.5f)));
    ChunkSession session(1);
    SessionKey key{ChunkCoord{0, 0}, LodLevel{255}};
    session.update_last_sent(key, filled(8, 0.5f));

    SECTION("unchanged chunk yields no-change") {
        auto response = prepare_response(header_for(0, 0, 255, false), session, source);
        REQUIRE(response.incremental);
        REQUIRE(response.payload.is_no_change());
    }
    SECTION("changed chunk yields a row delta") {
        Grid changed = filled(8, 0.5f);
        changed.set(2, 6, 0.9f);
        REQUIRE(source.set_chunk(0, 0, changed));

        auto response = prepare_response(header_for(0, 0, 255, false), session, source);
        REQUIRE(response.incremental);
        REQUIRE(delta_entry_count(response.payload) == 1);
        REQUIRE(apply_delta(session.last_sent(key)->to_payload(), response.payload) == changed.to_payload());
    }
    SECTION("force-full ignores the session") {
        auto response = prepare_response(header_for(0, 0, 255, true), session, source);
        REQUIRE_FALSE(response.incremental);
        REQUIRE(response.payload == filled(8, 0.5f).to_payload());
    }
    SECTION("another LOD is a separate entry") {
        auto response = prepare_response(header_for(0, 0, 127, false), session, source);
        REQUIRE_FALSE(response.incremental);
        REQUIRE(response.grid.size() == 4);
    }
}

TEST_CASE("prepare_response rejects lod byte 0", "[processor]") {
    MemoryChunkSource source(8);
    ChunkSession session(1);
    REQUIRE_THROWS_AS(prepare_response(header_for(0, 0, 0, true), session, source), InvalidRequest);
}
