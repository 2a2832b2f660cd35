#include "admission_controller.hpp"
#include <utility>

namespace terrastream::server {

AdmissionController::Slot& AdmissionController::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void AdmissionController::Slot::release() {
    if (owner_) {
        AdmissionController* owner = owner_;
        owner_ = nullptr;
        owner->release_one();
    }
}

AdmissionController::AdmissionController(asio::any_io_executor executor, size_t limit)
    : executor_(std::move(executor))
    , limit_(limit) {
}

void AdmissionController::async_acquire(Handler handler) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ >= limit_ || !waiters_.empty()) {
            waiters_.push_back(std::move(handler));
            return;
        }
        ++in_use_;
    }
    asio::post(executor_, [this, handler = std::move(handler)]() {
        handler(asio::error_code(), Slot(this));
    });
}

std::optional<AdmissionController::Slot> AdmissionController::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ >= limit_ || !waiters_.empty()) {
        return std::nullopt;
    }
    ++in_use_;
    return Slot(this);
}

void AdmissionController::cancel_waiters() {
    std::deque<Handler> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(cancelled, waiters_);
    }
    for (auto& handler : cancelled) {
        asio::post(executor_, [handler = std::move(handler)]() {
            handler(asio::error::operation_aborted, Slot());
        });
    }
}

size_t AdmissionController::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

size_t AdmissionController::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

void AdmissionController::release_one() {
    Handler next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (waiters_.empty()) {
            --in_use_;
            return;
        }
        // The unit passes straight to the next waiter; in_use_ is unchanged
        next = std::move(waiters_.front());
        waiters_.pop_front();
    }
    asio::post(executor_, [this, next = std::move(next)]() {
        next(asio::error_code(), Slot(this));
    });
}

} // namespace terrastream::server
