#include "handshake.hpp"
#include "transfer.hpp"
#include "protocol/packet.hpp"
#include <algorithm>
#include <array>
#include <vector>

using boost::asio::ip::tcp;

namespace networking {

namespace {

using Clock = std::chrono::steady_clock;
using Reason = HandshakeError::Reason;

// Runs the io_context until the pending operation has reported into `ec` or
// the deadline passes. On timeout the socket is closed and the aborted
// handler is drained before throwing.
void wait_for(boost::asio::io_context& io_context, tcp::socket& socket,
              const boost::system::error_code& ec, Clock::time_point deadline,
              const std::string& stage) {
    io_context.restart();
    io_context.run_until(deadline);
    if (ec == boost::asio::error::would_block) {
        boost::system::error_code ignored;
        socket.close(ignored);
        io_context.restart();
        io_context.run();
        throw HandshakeError(Reason::Timeout, "Handshake timed out while " + stage);
    }
}

std::string read_with_deadline(boost::asio::io_context& io_context, tcp::socket& socket,
                               std::size_t size, Clock::time_point deadline,
                               const std::string& stage) {
    std::vector<char> buf(size);
    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_read(socket, boost::asio::buffer(buf),
        [&ec](const boost::system::error_code& result, std::size_t) { ec = result; });
    wait_for(io_context, socket, ec, deadline, stage);
    if (ec) {
        throw HandshakeError(Reason::ConnectionFailed,
                             "Connection lost while " + stage + ": " + ec.message());
    }
    return std::string(buf.begin(), buf.end());
}

} // namespace

const char* to_string(HandshakeError::Reason reason) {
    switch (reason) {
        case Reason::Rejected: return "rejected";
        case Reason::ConnectionFailed: return "connection failed";
        case Reason::Timeout: return "timeout";
        case Reason::ProtocolViolation: return "protocol violation";
    }
    return "unknown";
}

ControlConnection send_control_offer(const std::string& host, unsigned short port,
                                     const protocol::Offer& offer,
                                     std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    ControlConnection conn;
    conn.io_context = std::make_unique<boost::asio::io_context>();
    conn.socket = std::make_unique<tcp::socket>(*conn.io_context);
    boost::asio::io_context& io_context = *conn.io_context;
    tcp::socket& socket = *conn.socket;

    // --- Connect ---
    tcp::resolver resolver(io_context);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw HandshakeError(Reason::ConnectionFailed,
                             "Could not resolve " + host + ": " + ec.message());
    }

    ec = boost::asio::error::would_block;
    boost::asio::async_connect(socket, endpoints,
        [&ec](const boost::system::error_code& result, const tcp::endpoint&) { ec = result; });
    wait_for(io_context, socket, ec, deadline, "connecting to " + host);
    if (ec) {
        throw HandshakeError(Reason::ConnectionFailed,
                             "Could not connect to " + host + ":" + std::to_string(port) + ": " + ec.message());
    }

    // --- Offer ---
    try {
        transfer::MessageSender::send_offer(socket, offer);
    } catch (const boost::system::system_error& e) {
        throw HandshakeError(Reason::ConnectionFailed, std::string("Could not send offer: ") + e.what());
    }

    // --- Response ---
    std::string raw = read_with_deadline(io_context, socket, protocol::HEADER_SIZE, deadline,
                                         "waiting for offer response");
    std::array<uint8_t, protocol::HEADER_SIZE> header_buf;
    std::copy(raw.begin(), raw.end(), header_buf.begin());

    protocol::PacketHeader header;
    try {
        header = protocol::deserialize_header(header_buf);
    } catch (const protocol::DecodeError& e) {
        throw HandshakeError(Reason::ProtocolViolation, e.what());
    }

    if (protocol::is_command(header, protocol::CommandType::ACCEPT)) {
        if (header.session_id == 0) {
            throw HandshakeError(Reason::ProtocolViolation, "ACCEPT without a session id");
        }
        conn.session_id = header.session_id;
        return conn;
    }

    if (protocol::is_command(header, protocol::CommandType::REJECT)) {
        std::string reason = "rejected by receiver";
        if (header.payload_size > protocol::MAX_CONTROL_PAYLOAD) {
            throw HandshakeError(Reason::ProtocolViolation, "oversized REJECT payload");
        }
        if (header.payload_size > 0) {
            std::string payload = read_with_deadline(io_context, socket, header.payload_size, deadline,
                                                     "reading reject reason");
            try {
                reason = protocol::decode_reject(payload).reason;
            } catch (const protocol::DecodeError& e) {
                throw HandshakeError(Reason::ProtocolViolation, e.what());
            }
        }
        throw HandshakeError(Reason::Rejected, "Offer rejected: " + reason);
    }

    throw HandshakeError(Reason::ProtocolViolation,
                         std::string("Unexpected response to offer: ") + protocol::command_name(header.command));
}

} // namespace networking
