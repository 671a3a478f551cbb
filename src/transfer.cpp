#include "transfer.hpp"
#include "security.hpp"
#include <iostream>
#include <vector>
#include <array>
#include <fstream>
#include <algorithm>
#include <cctype>

namespace transfer {

// ─── Framing ────────────────────────────────────────────────────────────────

void MessageSender::send_header(boost::asio::ip::tcp::socket& socket, const protocol::PacketHeader& header) {
    auto buf = protocol::serialize_header(header);
    boost::asio::write(socket, boost::asio::buffer(buf));
}

void MessageSender::send_packet(boost::asio::ip::tcp::socket& socket, protocol::CommandType command,
                                uint32_t session_id, const std::string& payload) {
    auto header = protocol::serialize_header(
        protocol::make_header(command, static_cast<uint32_t>(payload.size()), session_id));
    std::array<boost::asio::const_buffer, 2> buffers{
        boost::asio::buffer(header),
        boost::asio::buffer(payload)
    };
    boost::asio::write(socket, buffers);
}

void MessageSender::send_offer(boost::asio::ip::tcp::socket& socket, const protocol::Offer& offer) {
    send_packet(socket, protocol::CommandType::OFFER, 0, protocol::encode_offer(offer));
}

void MessageSender::send_reject(boost::asio::ip::tcp::socket& socket, const std::string& reason) {
    send_packet(socket, protocol::CommandType::REJECT, 0, protocol::encode_reject({reason}));
}

void MessageSender::send_complete(boost::asio::ip::tcp::socket& socket, uint32_t session_id,
                                  const protocol::CompleteInfo& info) {
    send_packet(socket, protocol::CommandType::COMPLETE, session_id, protocol::encode_complete(info));
}

void MessageSender::send_chunk(boost::asio::ip::tcp::socket& socket, uint32_t session_id, uint32_t index,
                               const char* data, std::size_t size) {
    auto header = protocol::serialize_header(protocol::make_header(
        protocol::CommandType::CHUNK, static_cast<uint32_t>(size), session_id, index));
    std::array<boost::asio::const_buffer, 2> buffers{
        boost::asio::buffer(header),
        boost::asio::buffer(data, size)
    };
    boost::asio::write(socket, buffers);
}

bool MessageSender::try_send_header(boost::asio::ip::tcp::socket& socket, const protocol::PacketHeader& header) {
    try {
        send_header(socket, header);
        return true;
    } catch (std::exception& e) {
        std::cerr << "MessageSender Exception: " << e.what() << "\n";
        return false;
    }
}

protocol::PacketHeader MessageReceiver::receive_header(boost::asio::ip::tcp::socket& socket) {
    std::array<uint8_t, protocol::HEADER_SIZE> buf;
    boost::asio::read(socket, boost::asio::buffer(buf));
    return protocol::deserialize_header(buf);
}

std::string MessageReceiver::receive_payload(boost::asio::ip::tcp::socket& socket, uint32_t payload_size,
                                             uint32_t limit) {
    if (payload_size > limit) {
        throw protocol::DecodeError("payload of " + std::to_string(payload_size) +
                                    " bytes exceeds limit of " + std::to_string(limit));
    }
    std::string payload(payload_size, '\0');
    if (payload_size > 0) {
        boost::asio::read(socket, boost::asio::buffer(&payload[0], payload.size()));
    }
    return payload;
}

// ─── Session ────────────────────────────────────────────────────────────────

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::PENDING: return "pending";
        case SessionState::ACCEPTED: return "accepted";
        case SessionState::TRANSFERRING: return "transferring";
        case SessionState::COMPLETED: return "completed";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(protocol::Offer offer) : offer_(std::move(offer)) {}

void TransferSession::expect(SessionState expected, const char* action) const {
    if (state_ != expected) {
        throw std::logic_error(std::string("TransferSession: cannot ") + action + " in state " + to_string(state_));
    }
}

void TransferSession::accept(uint32_t session_id) {
    expect(SessionState::PENDING, "accept");
    id_ = session_id;
    state_ = SessionState::ACCEPTED;
    started_at_ = std::chrono::system_clock::now();
}

void TransferSession::begin() {
    expect(SessionState::ACCEPTED, "begin");
    state_ = SessionState::TRANSFERRING;
}

void TransferSession::add_bytes(uint64_t count) {
    expect(SessionState::TRANSFERRING, "add bytes");
    bytes_transferred_ += count;
}

void TransferSession::complete() {
    expect(SessionState::TRANSFERRING, "complete");
    state_ = SessionState::COMPLETED;
    finished_at_ = std::chrono::system_clock::now();
}

void TransferSession::fail(const std::string& error) {
    if (is_terminal()) {
        throw std::logic_error(std::string("TransferSession: cannot fail in state ") + to_string(state_));
    }
    error_ = error;
    state_ = SessionState::FAILED;
    finished_at_ = std::chrono::system_clock::now();
}

// ─── Send path ──────────────────────────────────────────────────────────────

Sender::Sender(const std::filesystem::path& source, uint32_t chunk_size, const std::string& filename)
    : source_(source) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source_, ec)) {
        throw TransferError("Not a regular file: " + source_.string());
    }
    auto size = std::filesystem::file_size(source_, ec);
    if (ec) {
        throw TransferError("Could not stat " + source_.string() + ": " + ec.message());
    }
    std::string name = filename.empty() ? source_.filename().string() : filename;
    try {
        offer_ = protocol::make_offer(name, size, chunk_size);
    } catch (const protocol::DecodeError& e) {
        throw TransferError(e.what());
    }
}

SendResult Sender::send(const std::string& host, unsigned short port,
                        const HandshakeFn& handshake, const ProgressCallback& progress_callback) {
    TransferSession session(offer_);

    // Throws HandshakeError; nothing has been streamed yet.
    networking::ControlConnection conn = handshake(host, port, offer_, handshake_timeout_);
    boost::asio::ip::tcp::socket& socket = *conn.socket;
    session.accept(conn.session_id);
    session.begin();

    auto abort = [&](const std::string& reason) -> TransferError {
        MessageSender::try_send_header(socket,
            protocol::make_header(protocol::CommandType::CANCEL, 0, session.id()));
        session.fail(reason);
        return TransferError(reason);
    };

    std::ifstream file(source_, std::ios::binary);
    if (!file.is_open()) {
        throw abort("Could not open file for reading: " + source_.string());
    }

    security::Sha256 hasher;
    std::vector<char> buffer(std::min<uint64_t>(offer_.chunk_size, offer_.total_size));
    uint64_t chunks_sent = 0;

    for (uint64_t index = 0; index < offer_.total_chunks; ++index) {
        if (cancel_requested_) {
            throw abort("Transfer cancelled locally");
        }

        const uint32_t length = protocol::chunk_length(offer_, index);
        file.read(buffer.data(), length);
        if (static_cast<uint64_t>(file.gcount()) != length) {
            throw abort("Source became unreadable at chunk " + std::to_string(index) + ": " + source_.string());
        }
        hasher.update(buffer.data(), length);

        try {
            MessageSender::send_chunk(socket, session.id(), static_cast<uint32_t>(index), buffer.data(), length);
        } catch (const boost::system::system_error& e) {
            session.fail(e.what());
            throw TransferError(std::string("Connection lost during transfer: ") + e.what());
        }
        session.add_bytes(length);
        ++chunks_sent;

        if (progress_callback) {
            progress_callback(index, length);
        }
    }

    // The receiver reports once the file is in place.
    protocol::CompleteInfo report;
    try {
        protocol::PacketHeader header = MessageReceiver::receive_header(socket);
        if (protocol::is_command(header, protocol::CommandType::CANCEL)) {
            session.fail("Receiver aborted the transfer");
            throw TransferError("Receiver aborted the transfer");
        }
        if (!protocol::is_command(header, protocol::CommandType::COMPLETE)) {
            throw protocol::DecodeError(std::string("expected COMPLETE, got ") + protocol::command_name(header.command));
        }
        report = protocol::decode_complete(MessageReceiver::receive_payload(socket, header.payload_size));
    } catch (const boost::system::system_error& e) {
        session.fail(e.what());
        throw TransferError(std::string("Connection lost before completion report: ") + e.what());
    } catch (const protocol::DecodeError& e) {
        session.fail(e.what());
        throw TransferError(std::string("Bad completion report: ") + e.what());
    }

    if (!report.ok || report.bytes != offer_.total_size) {
        session.fail("Receiver reported failure");
        throw TransferError("Receiver reported failure after " + std::to_string(report.bytes) + " bytes");
    }
    session.complete();

    boost::system::error_code ignored;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

    return SendResult{session.id(), session.bytes_transferred(), chunks_sent,
                      hasher.finish_hex(), report.sha256};
}

// ─── Receive path ───────────────────────────────────────────────────────────

std::string safe_filename(const std::string& name) {
    // Keep only the last path component
    std::string base = name;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string out;
    for (char ch : base) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || ch == ' ' || ch == '.' || ch == '-' || ch == '_') {
            out += ch;
        } else {
            out += '_';
        }
    }

    // No hidden files
    auto first = out.find_first_not_of(". ");
    out = (first == std::string::npos) ? "" : out.substr(first);
    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out.empty() ? "received_file" : out;
}

Receiver::Receiver(const std::filesystem::path& save_path, uint32_t chunk_size, uint64_t total_chunks,
                   const std::filesystem::path& out_dir, StartHook on_start, CompleteHook on_complete)
    : out_dir_(out_dir),
      chunk_size_(chunk_size),
      total_chunks_(total_chunks),
      on_start_(std::move(on_start)),
      on_complete_(std::move(on_complete)) {
    if (save_path.empty()) {
        throw std::invalid_argument("Receiver: empty save path");
    }
    if (chunk_size_ == 0 || chunk_size_ > protocol::MAX_CHUNK_SIZE) {
        throw std::invalid_argument("Receiver: chunk size " + std::to_string(chunk_size_) + " out of range");
    }
    save_path_ = out_dir_.empty() ? save_path : out_dir_ / save_path;
    save_path_ = save_path_.lexically_normal();

    if (!out_dir_.empty()) {
        auto base = out_dir_.lexically_normal();
        auto rel = save_path_.lexically_relative(base);
        if (rel.empty() || *rel.begin() == "..") {
            throw std::invalid_argument("Receiver: " + save_path_.string() + " is outside " + base.string());
        }
    }
    if (!save_path_.has_filename()) {
        throw std::invalid_argument("Receiver: save path has no file name: " + save_path_.string());
    }
}

std::filesystem::path Receiver::staging_path() const {
    return std::filesystem::path(save_path_.string() + PART_SUFFIX);
}

CompleteMeta Receiver::handle_offer_and_receive(boost::asio::ip::tcp::socket& socket, TransferSession& session) {
    const protocol::Offer& offer = session.offer();
    const std::filesystem::path part_path = staging_path();
    CompleteMeta meta{session.id(), save_path_, "", false, 0, ""};

    try {
        if (!matches(offer)) {
            throw TransferError("Offer does not match receiver: expected " + std::to_string(total_chunks_) +
                                " chunks of " + std::to_string(chunk_size_) + " bytes");
        }
        session.begin();

        if (on_start_) {
            on_start_(StartMeta{session.id(), offer.filename, offer.total_size, offer.total_chunks, save_path_});
        }

        receive_chunks(socket, session, part_path);

        meta.bytes_transferred = session.bytes_transferred();
        meta.sha256 = security::sha256_file(part_path);
        meta.ok = (meta.bytes_transferred == offer.total_size);
        if (!meta.ok) {
            throw TransferError("Received " + std::to_string(meta.bytes_transferred) + " of " +
                                std::to_string(offer.total_size) + " bytes");
        }

        std::filesystem::rename(part_path, save_path_);
        session.complete();

        try {
            MessageSender::send_complete(socket, session.id(), {meta.sha256, meta.ok, meta.bytes_transferred});
        } catch (const boost::system::system_error& e) {
            // The file is complete on disk; only the sender misses the report.
            std::cerr << "Receiver: could not send completion report: " << e.what() << "\n";
        }
    } catch (std::exception& e) {
        std::cerr << "Receiver Exception: " << e.what() << "\n";
        meta.ok = false;
        meta.error = e.what();
        meta.bytes_transferred = session.bytes_transferred();

        std::error_code ec;
        std::filesystem::remove(part_path, ec);
        if (!session.is_terminal()) {
            session.fail(e.what());
        }
        MessageSender::try_send_header(socket,
            protocol::make_header(protocol::CommandType::CANCEL, 0, session.id()));
    }

    if (on_complete_) {
        try {
            on_complete_(meta);
        } catch (std::exception& e) {
            std::cerr << "Receiver: on_complete hook threw: " << e.what() << "\n";
        }
    }
    return meta;
}

void Receiver::receive_chunks(boost::asio::ip::tcp::socket& socket, TransferSession& session,
                              const std::filesystem::path& part_path) {
    const protocol::Offer& offer = session.offer();

    // Ensure parent directories exist for nested file paths
    std::filesystem::path parent = part_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream file(part_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw TransferError("Could not open file for writing: " + part_path.string());
    }

    // Never more than the file itself, whatever the offer claims
    std::vector<char> buffer(std::min<uint64_t>(chunk_size_, offer.total_size));
    for (uint64_t index = 0; index < total_chunks_; ++index) {
        if (cancel_requested_) {
            throw TransferError("Transfer cancelled locally");
        }

        protocol::PacketHeader header = MessageReceiver::receive_header(socket);
        if (protocol::is_command(header, protocol::CommandType::CANCEL)) {
            throw TransferError("Transfer cancelled by sender");
        }
        if (!protocol::is_command(header, protocol::CommandType::CHUNK)) {
            throw protocol::DecodeError(std::string("expected CHUNK, got ") + protocol::command_name(header.command));
        }
        if (header.session_id != session.id()) {
            throw protocol::DecodeError("chunk for foreign session " + std::to_string(header.session_id));
        }
        if (header.sequence != index) {
            throw protocol::DecodeError("out-of-order chunk " + std::to_string(header.sequence) +
                                        ", expected " + std::to_string(index));
        }
        const uint32_t expected = protocol::chunk_length(offer, index);
        if (header.payload_size != expected) {
            throw protocol::DecodeError("chunk " + std::to_string(index) + " carries " +
                                        std::to_string(header.payload_size) + " bytes, expected " +
                                        std::to_string(expected));
        }

        boost::asio::read(socket, boost::asio::buffer(buffer.data(), header.payload_size));
        file.write(buffer.data(), header.payload_size);
        if (!file) {
            throw TransferError("Disk write failed: " + part_path.string());
        }
        session.add_bytes(header.payload_size);

        if (on_progress_) {
            on_progress_(index, header.payload_size);
        }
    }

    file.close();
    if (file.fail()) {
        throw TransferError("Could not finalize " + part_path.string());
    }
}

} // namespace transfer
