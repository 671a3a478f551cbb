#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <cstdint>
#include <boost/asio.hpp>
#include "protocol/offer.hpp"

namespace networking {

constexpr std::chrono::milliseconds DEFAULT_HANDSHAKE_TIMEOUT{5000};

class HandshakeError : public std::runtime_error {
public:
    enum class Reason {
        Rejected,
        ConnectionFailed,
        Timeout,
        ProtocolViolation
    };

    HandshakeError(Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

const char* to_string(HandshakeError::Reason reason);

// An accepted control connection. Chunk frames may be written once this exists.
struct ControlConnection {
    std::unique_ptr<boost::asio::io_context> io_context;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket;
    uint32_t session_id = 0;
};

// Connects to host:port, sends the offer and waits at most `timeout` for
// connect and for the ACCEPT/REJECT reply. Throws HandshakeError.
ControlConnection send_control_offer(const std::string& host, unsigned short port,
                                     const protocol::Offer& offer,
                                     std::chrono::milliseconds timeout);

} // namespace networking
