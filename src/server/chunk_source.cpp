#include "chunk_source.hpp"
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>
#include <vector>

namespace terrastream::server {

using namespace terrastream::protocol;

DirectoryChunkSource::DirectoryChunkSource(std::string dir, uint32_t chunk_size)
    : ChunkSource(chunk_size)
    , dir_(std::move(dir)) {
}

std::string DirectoryChunkSource::path_for(int32_t cx, int32_t cy) const {
    return (std::filesystem::path(dir_) / (std::to_string(cx) + "_" + std::to_string(cy) + ".dat")).string();
}

Grid DirectoryChunkSource::load_chunk(int32_t cx, int32_t cy) {
    std::string path = path_for(cx, cy);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return empty_chunk();
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::cerr << "[ChunkSource] Failed to open " << path << std::endl;
        return empty_chunk();
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    try {
        Grid grid = Grid::from_payload(Payload::from_msgpack(bytes));
        if (grid.size() != chunk_size()) {
            std::cerr << "[ChunkSource] " << path << " is " << grid.size() << " wide, expected "
                      << chunk_size() << std::endl;
            return empty_chunk();
        }
        return grid;
    } catch (const std::exception& e) {
        std::cerr << "[ChunkSource] Error reading " << path << ": " << e.what() << std::endl;
        return empty_chunk();
    }
}

bool DirectoryChunkSource::save_chunk(int32_t cx, int32_t cy, const Grid& grid) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        std::cerr << "[ChunkSource] Cannot create " << dir_ << ": " << ec.message() << std::endl;
        return false;
    }

    std::string path = path_for(cx, cy);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        std::cerr << "[ChunkSource] Failed to open " << path << " for writing" << std::endl;
        return false;
    }
    std::vector<uint8_t> bytes = Payload::to_msgpack(grid.to_payload());
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(f);
}

MemoryChunkSource::MemoryChunkSource(uint32_t chunk_size)
    : ChunkSource(chunk_size) {
}

Grid MemoryChunkSource::load_chunk(int32_t cx, int32_t cy) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(ChunkCoord{cx, cy});
    if (it != chunks_.end()) {
        return it->second;
    }
    return empty_chunk();
}

bool MemoryChunkSource::set_chunk(int32_t cx, int32_t cy, Grid grid) {
    if (grid.size() != chunk_size()) {
        std::cerr << "[ChunkSource] Rejecting " << grid.size() << "-wide grid for chunk ("
                  << cx << ", " << cy << "), expected " << chunk_size() << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_[ChunkCoord{cx, cy}] = std::move(grid);
    return true;
}

void MemoryChunkSource::erase_chunk(int32_t cx, int32_t cy) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.erase(ChunkCoord{cx, cy});
}

size_t MemoryChunkSource::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

} // namespace terrastream::server
