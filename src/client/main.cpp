#include "client/ascii_preview.hpp"
#include "client/chunk_client.hpp"
#include "protocol/diff.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

using namespace terrastream;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <host> <port> <cx> <cy> <lod> [--full] [--repeat N]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 6) {
        print_usage(argv[0]);
        return 1;
    }

    std::string host = argv[1];
    uint16_t port = 0;
    int32_t cx = 0;
    int32_t cy = 0;
    double lod = 1.0;
    bool force_full = false;
    int repeat = 1;

    try {
        port = static_cast<uint16_t>(std::stoi(argv[2]));
        cx = std::stoi(argv[3]);
        cy = std::stoi(argv[4]);
        lod = std::stod(argv[5]);
        for (int i = 6; i < argc; ++i) {
            if (std::strcmp(argv[i], "--full") == 0) {
                force_full = true;
            } else if (std::strcmp(argv[i], "--repeat") == 0 && i + 1 < argc) {
                repeat = std::max(1, std::stoi(argv[++i]));
            } else {
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    client::ChunkClient chunk_client;
    if (!chunk_client.connect(host, port)) {
        return 1;
    }

    try {
        for (int i = 0; i < repeat; ++i) {
            auto reply = chunk_client.request(cx, cy, lod, force_full);
            std::cout << "Chunk (" << cx << ", " << cy << ") lod byte " << static_cast<int>(reply.key.lod.byte)
                      << ": " << reply.grid.size() << "x" << reply.grid.size() << ", "
                      << reply.frame_bytes << " bytes, "
                      << (reply.incremental
                              ? std::to_string(protocol::delta_entry_count(reply.payload)) + " changed row(s)"
                              : std::string("full"))
                      << std::endl;
            if (i == 0) {
                std::cout << client::ascii_preview(reply.grid);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Request failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
