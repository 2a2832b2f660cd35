#pragma once

#include <stdexcept>
#include <string>

namespace terrastream::protocol {

// A received frame could not be decoded (bad length prefix, inflate failure,
// malformed value encoding). Raised on the receiving side only.
class CorruptFrame : public std::runtime_error {
public:
    explicit CorruptFrame(const std::string& what)
        : std::runtime_error("corrupt frame: " + what) {}
};

// The peer sent a request the server refuses to serve. Closes the connection.
class InvalidRequest : public std::runtime_error {
public:
    explicit InvalidRequest(const std::string& what)
        : std::runtime_error("invalid request: " + what) {}
};

// A frame could not be written after exhausting all retry attempts.
class DeliveryFailed : public std::runtime_error {
public:
    DeliveryFailed(const std::string& what, int attempts)
        : std::runtime_error("delivery failed after " + std::to_string(attempts) + " attempt(s): " + what)
        , attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

} // namespace terrastream::protocol
