#include "delivery.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace terrastream::server {

DeliveryEngine::Operation::Operation(asio::any_io_executor executor, FrameBuffer frame,
                                     WriteFunction write, CompletionHandler done)
    : frame_(std::move(frame))
    , write_(std::move(write))
    , done_(std::move(done))
    , timer_(std::move(executor)) {
}

void DeliveryEngine::Operation::cancel() {
    cancelled_ = true;
    timer_.cancel();
}

DeliveryEngine::DeliveryEngine(const DeliveryConfig& config)
    : max_retries_(std::max(1, config.max_retries))
    , base_delay_(static_cast<int64_t>(config.retry_base_delay * 1000.0f))
    , max_delay_(static_cast<int64_t>(config.retry_max_delay * 1000.0f)) {
}

std::chrono::milliseconds DeliveryEngine::backoff_delay(int attempt) const {
    // Stop doubling once past the cap so the shift cannot overflow
    std::chrono::milliseconds delay = base_delay_;
    for (int i = 0; i < attempt && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

std::shared_ptr<DeliveryEngine::Operation> DeliveryEngine::deliver(asio::any_io_executor executor, FrameBuffer frame,
                                                                   WriteFunction write, CompletionHandler done) {
    std::shared_ptr<Operation> op(new Operation(std::move(executor), std::move(frame), std::move(write), std::move(done)));
    start_attempt(op);
    return op;
}

void DeliveryEngine::start_attempt(const std::shared_ptr<Operation>& op) {
    const auto& bytes = *op->frame_;
    asio::const_buffer remaining = asio::buffer(bytes.data() + op->offset_, bytes.size() - op->offset_);
    op->write_(remaining, [this, op](asio::error_code ec, std::size_t written) {
        on_write(op, ec, written);
    });
}

void DeliveryEngine::on_write(const std::shared_ptr<Operation>& op, asio::error_code ec, std::size_t written) {
    op->offset_ += written;
    ++op->attempt_;

    if (!ec || op->offset_ >= op->frame_->size()) {
        op->done_(asio::error_code(), op->attempt_);
        return;
    }

    if (op->cancelled_) {
        op->done_(asio::error::operation_aborted, op->attempt_);
        return;
    }

    if (ec == asio::error::operation_aborted || op->attempt_ >= max_retries_) {
        op->done_(ec, op->attempt_);
        return;
    }

    auto delay = backoff_delay(op->attempt_ - 1);
    std::cerr << "[Delivery] Write attempt " << op->attempt_ << "/" << max_retries_ << " failed: "
              << ec.message() << ", retrying in " << delay.count() << " ms" << std::endl;

    op->timer_.expires_after(delay);
    op->timer_.async_wait([this, op](asio::error_code timer_ec) {
        if (op->cancelled_) {
            op->done_(asio::error::operation_aborted, op->attempt_);
            return;
        }
        if (timer_ec) {
            op->done_(timer_ec, op->attempt_);
            return;
        }
        start_attempt(op);
    });
}

} // namespace terrastream::server
