#include "stream_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace terrastream::server {

bool StreamConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[StreamConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);

        if (j.contains("server")) {
            const auto& s = j["server"];
            server_.port = s.value("port", server_.port);
            server_.max_connections = s.value("max_connections", server_.max_connections);
            server_.io_threads = s.value("io_threads", server_.io_threads);
            server_.shutdown_grace = s.value("shutdown_grace", server_.shutdown_grace);
        }

        if (j.contains("terrain")) {
            const auto& t = j["terrain"];
            terrain_.chunk_size = t.value("chunk_size", terrain_.chunk_size);
            terrain_.data_dir = t.value("data_dir", terrain_.data_dir);
        }

        if (j.contains("delivery")) {
            const auto& d = j["delivery"];
            delivery_.compression_level = d.value("compression_level", delivery_.compression_level);
            delivery_.max_retries = d.value("max_retries", delivery_.max_retries);
            delivery_.retry_base_delay = d.value("retry_base_delay", delivery_.retry_base_delay);
            delivery_.retry_max_delay = d.value("retry_max_delay", delivery_.retry_max_delay);
        }

        if (j.contains("cache")) {
            const auto& c = j["cache"];
            cache_.max_entries = c.value("max_entries", cache_.max_entries);
            cache_.max_age = c.value("max_age", cache_.max_age);
        }
    } catch (const json::exception& e) {
        std::cerr << "[StreamConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }

    validate();
    std::cout << "[StreamConfig] Loaded " << path << ": port " << server_.port
              << ", chunk " << terrain_.chunk_size << ", " << server_.max_connections
              << " connections, zlib level " << delivery_.compression_level << std::endl;
    return true;
}

void StreamConfig::apply_arguments(int argc, char* argv[]) {
    if (argc > 1) {
        std::string text = argv[1];
        size_t used = 0;
        unsigned long port = 0;
        try {
            port = std::stoul(text, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != text.size() || port > 65535) {
            throw std::invalid_argument("invalid port '" + text + "'");
        }
        server_.port = static_cast<uint16_t>(port);
    }
    if (argc > 2) {
        terrain_.data_dir = argv[2];
    }
}

bool StreamConfig::validate() {
    bool ok = true;

    auto clamp_int = [&ok](const char* name, int& value, int lo, int hi) {
        int clamped = std::clamp(value, lo, hi);
        if (clamped != value) {
            std::cerr << "[StreamConfig] " << name << " " << value << " out of range, using " << clamped << std::endl;
            value = clamped;
            ok = false;
        }
    };

    clamp_int("compression_level", delivery_.compression_level, 1, 9);
    clamp_int("max_retries", delivery_.max_retries, 1, 100);
    clamp_int("io_threads", server_.io_threads, 1, 256);

    if (server_.max_connections == 0) {
        std::cerr << "[StreamConfig] max_connections 0 would admit nobody, using 1" << std::endl;
        server_.max_connections = 1;
        ok = false;
    }
    if (terrain_.chunk_size == 0 || terrain_.chunk_size > protocol::MAX_GRID_SIZE) {
        std::cerr << "[StreamConfig] chunk_size " << terrain_.chunk_size << " out of range, using "
                  << protocol::DEFAULT_CHUNK_SIZE << std::endl;
        terrain_.chunk_size = protocol::DEFAULT_CHUNK_SIZE;
        ok = false;
    }
    if (delivery_.retry_base_delay < 0.0f) {
        std::cerr << "[StreamConfig] retry_base_delay negative, using 0" << std::endl;
        delivery_.retry_base_delay = 0.0f;
        ok = false;
    }
    if (delivery_.retry_max_delay < delivery_.retry_base_delay) {
        std::cerr << "[StreamConfig] retry_max_delay below retry_base_delay, raising it" << std::endl;
        delivery_.retry_max_delay = delivery_.retry_base_delay;
        ok = false;
    }
    if (server_.shutdown_grace < 0.0f) {
        server_.shutdown_grace = 0.0f;
        ok = false;
    }
    if (cache_.max_age < 0.0f) {
        cache_.max_age = 0.0f;
        ok = false;
    }
    return ok;
}

} // namespace terrastream::server
