#pragma once

#include <atomic>

namespace terrastream::server {

// Cooperative stop request. Connections check it between requests only,
// so a request in flight always completes.
class ShutdownFlag {
public:
    void request() { requested_.store(true, std::memory_order_release); }
    bool requested() const { return requested_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> requested_{false};
};

} // namespace terrastream::server
