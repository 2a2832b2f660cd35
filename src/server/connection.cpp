#include "connection.hpp"
#include "protocol/errors.hpp"
#include "protocol/frame.hpp"
#include "server/server.hpp"
#include <iostream>
#include <utility>
#include <vector>

namespace terrastream::server {

using namespace terrastream::protocol;

namespace {

// Peer went away (or we closed the socket) rather than something breaking
bool is_disconnect(const asio::error_code& ec) {
    return ec == asio::error::eof
        || ec == asio::error::connection_reset
        || ec == asio::error::connection_aborted
        || ec == asio::error::operation_aborted;
}

} // namespace

const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::AwaitingAdmission: return "AwaitingAdmission";
        case ConnectionState::AwaitingHeader:    return "AwaitingHeader";
        case ConnectionState::Processing:        return "Processing";
        case ConnectionState::Sending:           return "Sending";
        case ConnectionState::Closed:            return "Closed";
        case ConnectionState::ClosedOnError:     return "ClosedOnError";
    }
    return "Unknown";
}

Connection::Connection(tcp::socket socket, Server& server, uint64_t id)
    : socket_(std::move(socket))
    , server_(server)
    , session_(id) {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

Connection::~Connection() {
    // Slot returns to the admission controller in its own destructor
    if (!finished()) {
        asio::error_code ec;
        socket_.close(ec);
    }
}

bool Connection::finished() const {
    auto s = state();
    return s == ConnectionState::Closed || s == ConnectionState::ClosedOnError;
}

void Connection::start() {
    auto self = shared_from_this();
    server_.admission().async_acquire(
        [this, self](asio::error_code ec, AdmissionController::Slot slot) {
            // Admission completes on the server's executor; continue on the strand
            asio::dispatch(socket_.get_executor(), [this, self, ec, slot = std::move(slot)]() mutable {
                if (ec) {
                    std::cout << "[Connection " << id() << "] Admission cancelled" << std::endl;
                    finish(ConnectionState::Closed);
                    return;
                }
                slot_ = std::move(slot);
                std::cout << "[Connection " << id() << "] Admitted " << peer_ << " ("
                          << server_.admission().in_use() << "/" << server_.admission().limit()
                          << " slots)" << std::endl;
                next_request();
            });
        });
}

void Connection::close() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self]() {
        if (auto op = delivery_.lock()) {
            op->cancel();
        }
        asio::error_code ec;
        socket_.close(ec);
    });
}

void Connection::next_request() {
    if (server_.shutdown_flag().requested()) {
        std::cout << "[Connection " << id() << "] Shutdown requested, closing after "
                  << requests_served() << " request(s)" << std::endl;
        finish(ConnectionState::Closed);
        return;
    }
    read_header();
}

void Connection::read_header() {
    state_ = ConnectionState::AwaitingHeader;
    auto self = shared_from_this();
    asio::async_read(socket_,
        asio::buffer(header_buffer_),
        [this, self](asio::error_code ec, std::size_t length) {
            if (!ec) {
                handle_request();
                return;
            }
            if (is_disconnect(ec)) {
                if (length > 0) {
                    std::cout << "[Connection " << id() << "] Peer closed mid-header after "
                              << length << " of " << REQUEST_HEADER_SIZE << " bytes" << std::endl;
                }
                finish(ConnectionState::Closed);
            } else {
                std::cerr << "[Connection " << id() << "] Header read error: " << ec.message() << std::endl;
                finish(ConnectionState::ClosedOnError);
            }
        });
}

void Connection::handle_request() {
    state_ = ConnectionState::Processing;
    try {
        current_header_ = RequestHeader::from_bytes(header_buffer_);
        send_response(prepare_response(current_header_, session_, server_.source()));
    } catch (const std::exception& e) {
        fail(e);
    }
}

FrameBuffer Connection::encode_payload(const PreparedResponse& response) {
    int level = server_.config().delivery().compression_level;
    if (response.incremental) {
        return std::make_shared<const std::vector<uint8_t>>(encode_frame(response.payload, level));
    }

    auto& cache = server_.frame_cache();
    if (FrameBuffer cached = cache.find(response.key, response.grid)) {
        return cached;
    }
    auto frame = std::make_shared<const std::vector<uint8_t>>(encode_frame(response.payload, level));
    cache.store(response.key, response.grid, frame);
    return frame;
}

void Connection::send_response(PreparedResponse response) {
    state_ = ConnectionState::Sending;
    FrameBuffer frame = encode_payload(response);

    auto self = shared_from_this();
    auto pending = std::make_shared<PreparedResponse>(std::move(response));
    delivery_ = server_.delivery().deliver(
        socket_.get_executor(),
        frame,
        [this, self](asio::const_buffer buffer, DeliveryEngine::WriteHandler handler) {
            asio::async_write(socket_, buffer, std::move(handler));
        },
        [this, self, pending](asio::error_code ec, int attempts) {
            on_delivered(std::move(*pending), ec, attempts);
        });
}

void Connection::on_delivered(PreparedResponse response, asio::error_code ec, int attempts) {
    if (ec) {
        // Session stays at what the client last received; the connection is dropped
        if (ec == asio::error::operation_aborted) {
            finish(ConnectionState::Closed);
        } else {
            fail(DeliveryFailed(ec.message(), attempts));
        }
        return;
    }

    session_.update_last_sent(response.key, std::move(response.grid));
    ++requests_served_;
    next_request();
}

void Connection::fail(const std::exception& error) {
    std::cerr << "[Connection " << id() << "] Closing on error in state " << state_name(state())
              << ": " << error.what() << std::endl;
    finish(ConnectionState::ClosedOnError);
}

void Connection::finish(ConnectionState final_state) {
    if (finished()) return;
    state_ = final_state;

    asio::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    slot_.release();

    server_.on_connection_closed(*this);
}

} // namespace terrastream::server
