#pragma once

#include <asio.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace terrastream::server {

// Counting semaphore bounding concurrent connections. Waiters are queued
// and granted in arrival order; only the waiting connection is held up.
class AdmissionController {
public:
    // One unit of the connection budget. Move-only; returns the unit to the
    // controller when released or destroyed, whichever happens first.
    class Slot {
    public:
        Slot() = default;
        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot() { release(); }

        void release();
        bool valid() const { return owner_ != nullptr; }

    private:
        friend class AdmissionController;
        explicit Slot(AdmissionController* owner) : owner_(owner) {}

        AdmissionController* owner_ = nullptr;
    };

    // Called with a valid slot once granted, or operation_aborted and an
    // empty slot if the wait was cancelled
    using Handler = std::function<void(asio::error_code, Slot)>;

    AdmissionController(asio::any_io_executor executor, size_t limit);

    // Handler is always invoked through the executor, never inline
    void async_acquire(Handler handler);

    std::optional<Slot> try_acquire();

    // Fails every queued waiter with operation_aborted
    void cancel_waiters();

    size_t limit() const { return limit_; }
    size_t in_use() const;
    size_t waiting() const;

private:
    void release_one();

    asio::any_io_executor executor_;
    const size_t limit_;

    mutable std::mutex mutex_;
    size_t in_use_ = 0;
    std::deque<Handler> waiters_;
};

} // namespace terrastream::server
