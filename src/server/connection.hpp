#pragma once

#include "protocol/request_header.hpp"
#include "server/admission_controller.hpp"
#include "server/chunk_session.hpp"
#include "server/delivery.hpp"
#include "server/request_processor.hpp"
#include <asio.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace terrastream::server {

class Server;

enum class ConnectionState : uint8_t {
    AwaitingAdmission,
    AwaitingHeader,
    Processing,
    Sending,
    Closed,
    ClosedOnError,
};

const char* state_name(ConnectionState state);

// One client's request/response loop:
//   admission -> [read header -> process -> send -> record] -> ... -> closed
// Requests on a connection are handled strictly one at a time, which keeps
// the session in step with what the client has received. The socket's
// executor is a strand; every handler of the connection runs on it.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using tcp = asio::ip::tcp;

    Connection(tcp::socket socket, Server& server, uint64_t id);
    ~Connection();

    void start();

    // Safe from any thread: stops a pending delivery and closes the socket on the strand
    void close();

    uint64_t id() const { return session_.connection_id(); }
    ConnectionState state() const { return state_.load(); }
    bool finished() const;
    uint64_t requests_served() const { return requests_served_.load(); }
    const std::string& peer() const { return peer_; }

private:
    void next_request();
    void read_header();
    void handle_request();
    void send_response(PreparedResponse response);
    void on_delivered(PreparedResponse response, asio::error_code ec, int attempts);

    FrameBuffer encode_payload(const PreparedResponse& response);
    void finish(ConnectionState final_state);
    void fail(const std::exception& error);

    tcp::socket socket_;
    Server& server_;
    std::string peer_;
    AdmissionController::Slot slot_;
    ChunkSession session_;
    std::weak_ptr<DeliveryEngine::Operation> delivery_;

    std::array<uint8_t, protocol::REQUEST_HEADER_SIZE> header_buffer_{};
    protocol::RequestHeader current_header_;

    std::atomic<ConnectionState> state_{ConnectionState::AwaitingAdmission};
    std::atomic<uint64_t> requests_served_{0};
};

} // namespace terrastream::server
