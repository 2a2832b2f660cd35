#pragma once

#include "protocol/frame.hpp"
#include "protocol/grid.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace terrastream::server {

struct ServerConfig {
    uint16_t port = 6000;
    size_t max_connections = 16;
    int io_threads = 1;
    float shutdown_grace = 5.0f;  // seconds before the io_context is stopped
};

struct TerrainConfig {
    uint32_t chunk_size = protocol::DEFAULT_CHUNK_SIZE;
    std::string data_dir = "dem_tiles";
};

struct DeliveryConfig {
    int compression_level = protocol::DEFAULT_COMPRESSION_LEVEL;
    int max_retries = 3;
    float retry_base_delay = 1.0f;  // seconds, doubled per failed attempt
    float retry_max_delay = 10.0f;
};

struct CacheConfig {
    size_t max_entries = 100;  // 0 disables the frame cache
    float max_age = 300.0f;    // seconds
};

class StreamConfig {
public:
    // Reads the sections present in the file; absent keys keep their defaults
    bool load(const std::string& path);

    const ServerConfig& server() const { return server_; }
    ServerConfig& server() { return server_; }

    const TerrainConfig& terrain() const { return terrain_; }
    TerrainConfig& terrain() { return terrain_; }

    const DeliveryConfig& delivery() const { return delivery_; }
    DeliveryConfig& delivery() { return delivery_; }

    const CacheConfig& cache() const { return cache_; }
    CacheConfig& cache() { return cache_; }

    // Positional overrides from the command line: [port] [data_dir].
    // Throws std::invalid_argument if the port is not a number in 0-65535.
    void apply_arguments(int argc, char* argv[]);

    // Clamp out-of-range values, logging each correction. Returns false if anything changed.
    bool validate();

private:
    ServerConfig server_;
    TerrainConfig terrain_;
    DeliveryConfig delivery_;
    CacheConfig cache_;
};

} // namespace terrastream::server
