#pragma once

#include "server/stream_config.hpp"
#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace terrastream::server {

using FrameBuffer = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * Writes frames with bounded retries and exponential backoff.
 *
 * A failed attempt resumes from the first unwritten byte, so a partial write
 * never duplicates frame bytes on the stream. Backoff before retry n (0-based
 * failed attempt) is min(base * 2^n, cap). operation_aborted (socket closed
 * locally) is reported immediately without retrying.
 */
class DeliveryEngine {
public:
    using WriteHandler = std::function<void(asio::error_code, std::size_t)>;

    // Starts one asynchronous write of the buffer, e.g. asio::async_write on a socket
    using WriteFunction = std::function<void(asio::const_buffer, WriteHandler)>;

    // ec is empty on success, otherwise the last write error. attempts >= 1.
    using CompletionHandler = std::function<void(asio::error_code ec, int attempts)>;

    // One frame in flight. Must only be touched from the executor it was
    // started on.
    class Operation {
    public:
        // No further attempt starts and a pending backoff ends at once; the
        // completion handler then sees operation_aborted
        void cancel();

        bool cancelled() const { return cancelled_; }
        int attempts() const { return attempt_; }
        std::size_t bytes_written() const { return offset_; }

    private:
        friend class DeliveryEngine;
        Operation(asio::any_io_executor executor, FrameBuffer frame, WriteFunction write, CompletionHandler done);

        FrameBuffer frame_;
        WriteFunction write_;
        CompletionHandler done_;
        std::size_t offset_ = 0;
        int attempt_ = 0;
        bool cancelled_ = false;
        asio::steady_timer timer_;
    };

    explicit DeliveryEngine(const DeliveryConfig& config);

    // The backoff timer waits on executor, which should be the one the write
    // function completes on (the connection's strand)
    std::shared_ptr<Operation> deliver(asio::any_io_executor executor, FrameBuffer frame,
                                       WriteFunction write, CompletionHandler done);

    std::chrono::milliseconds backoff_delay(int attempt) const;

    int max_retries() const { return max_retries_; }

private:
    void start_attempt(const std::shared_ptr<Operation>& op);
    void on_write(const std::shared_ptr<Operation>& op, asio::error_code ec, std::size_t written);

    int max_retries_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
};

} // namespace terrastream::server
