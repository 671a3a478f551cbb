#pragma once

#include <string>
#include <functional>
#include <filesystem>
#include <chrono>
#include <stdexcept>
#include <boost/asio.hpp>
#include "protocol/packet.hpp"
#include "protocol/offer.hpp"
#include "handshake.hpp"
#include <atomic>

namespace transfer {

constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

// Progress callback: chunk index, bytes in that chunk
using ProgressCallback = std::function<void(uint64_t, std::size_t)>;

using HandshakeFn = std::function<networking::ControlConnection(
    const std::string&, unsigned short, const protocol::Offer&, std::chrono::milliseconds)>;

class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& what) : std::runtime_error(what) {}
};

// ─── Framing ────────────────────────────────────────────────────────────────

class MessageSender {
public:
    static void send_header(boost::asio::ip::tcp::socket& socket, const protocol::PacketHeader& header);
    static void send_packet(boost::asio::ip::tcp::socket& socket, protocol::CommandType command,
                            uint32_t session_id, const std::string& payload);
    static void send_offer(boost::asio::ip::tcp::socket& socket, const protocol::Offer& offer);
    static void send_reject(boost::asio::ip::tcp::socket& socket, const std::string& reason);
    static void send_complete(boost::asio::ip::tcp::socket& socket, uint32_t session_id,
                              const protocol::CompleteInfo& info);
    static void send_chunk(boost::asio::ip::tcp::socket& socket, uint32_t session_id, uint32_t index,
                           const char* data, std::size_t size);
    // Best effort: logs and returns false instead of throwing.
    static bool try_send_header(boost::asio::ip::tcp::socket& socket, const protocol::PacketHeader& header);
};

class MessageReceiver {
public:
    static protocol::PacketHeader receive_header(boost::asio::ip::tcp::socket& socket);
    static std::string receive_payload(boost::asio::ip::tcp::socket& socket, uint32_t payload_size,
                                       uint32_t limit = protocol::MAX_CONTROL_PAYLOAD);
};

// ─── Session ────────────────────────────────────────────────────────────────

enum class SessionState {
    PENDING,
    ACCEPTED,
    TRANSFERRING,
    COMPLETED,
    FAILED
};

const char* to_string(SessionState state);

// One live send or receive. Touched only by the thread driving it.
class TransferSession {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit TransferSession(protocol::Offer offer);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void accept(uint32_t session_id);
    void begin();
    void add_bytes(uint64_t count);
    void complete();
    void fail(const std::string& error);

    uint32_t id() const { return id_; }
    const protocol::Offer& offer() const { return offer_; }
    SessionState state() const { return state_; }
    bool is_terminal() const { return state_ == SessionState::COMPLETED || state_ == SessionState::FAILED; }
    uint64_t bytes_transferred() const { return bytes_transferred_; }
    const std::string& error() const { return error_; }
    TimePoint started_at() const { return started_at_; }
    TimePoint finished_at() const { return finished_at_; }

private:
    void expect(SessionState expected, const char* action) const;

    const protocol::Offer offer_;
    uint32_t id_ = 0;
    SessionState state_ = SessionState::PENDING;
    uint64_t bytes_transferred_ = 0;
    std::string error_;
    TimePoint started_at_{};
    TimePoint finished_at_{};
};

// ─── Send path ──────────────────────────────────────────────────────────────

struct SendResult {
    uint32_t session_id;
    uint64_t bytes_sent;
    uint64_t chunks_sent;
    std::string local_sha256;
    std::string remote_sha256;
};

class Sender {
public:
    // Throws TransferError if the source is not a readable regular file.
    explicit Sender(const std::filesystem::path& source, uint32_t chunk_size = DEFAULT_CHUNK_SIZE,
                    const std::string& filename = "");

    uint64_t total_size() const { return offer_.total_size; }
    uint64_t total_chunks() const { return offer_.total_chunks; }
    const protocol::Offer& offer() const { return offer_; }

    void set_handshake_timeout(std::chrono::milliseconds timeout) { handshake_timeout_ = timeout; }

    // Handshake, then every chunk in order. Throws networking::HandshakeError
    // if no session was established and TransferError if it broke afterwards.
    SendResult send(const std::string& host, unsigned short port,
                    const HandshakeFn& handshake = networking::send_control_offer,
                    const ProgressCallback& progress_callback = nullptr);

    // Safe from any thread; the sending thread aborts before its next chunk.
    void cancel() { cancel_requested_ = true; }

private:
    std::filesystem::path source_;
    protocol::Offer offer_;
    std::chrono::milliseconds handshake_timeout_ = networking::DEFAULT_HANDSHAKE_TIMEOUT;
    std::atomic<bool> cancel_requested_{false};
};

// ─── Receive path ───────────────────────────────────────────────────────────

struct StartMeta {
    uint32_t session_id;
    std::string filename;
    uint64_t size;
    uint64_t total_chunks;
    std::filesystem::path save_path;
};

struct CompleteMeta {
    uint32_t session_id;
    std::filesystem::path save_path;
    std::string sha256;
    bool ok;
    uint64_t bytes_transferred;
    std::string error;
};

using StartHook = std::function<void(const StartMeta&)>;
using CompleteHook = std::function<void(const CompleteMeta&)>;

// Staged output carries this suffix until the last chunk has landed.
constexpr const char* PART_SUFFIX = ".part";

// Reduces an offered name to one safe path component.
std::string safe_filename(const std::string& name);

class Receiver {
public:
    // A relative save_path is placed under out_dir. Throws std::invalid_argument
    // if the resulting path would leave out_dir.
    Receiver(const std::filesystem::path& save_path, uint32_t chunk_size, uint64_t total_chunks,
             const std::filesystem::path& out_dir = {},
             StartHook on_start = nullptr, CompleteHook on_complete = nullptr);

    void set_progress_callback(ProgressCallback callback) { on_progress_ = std::move(callback); }

    const std::filesystem::path& save_path() const { return save_path_; }
    std::filesystem::path staging_path() const;
    const std::filesystem::path& out_dir() const { return out_dir_; }
    uint32_t chunk_size() const { return chunk_size_; }
    uint64_t total_chunks() const { return total_chunks_; }

    // True if this receiver's chunk accounting is the one `offer` announces.
    bool matches(const protocol::Offer& offer) const {
        return offer.chunk_size == chunk_size_ && offer.total_chunks == total_chunks_;
    }

    // Drives an accepted session to a terminal state. I/O failures are
    // reported through the result and on_complete, never thrown.
    CompleteMeta handle_offer_and_receive(boost::asio::ip::tcp::socket& socket, TransferSession& session);

    void cancel() { cancel_requested_ = true; }

private:
    void receive_chunks(boost::asio::ip::tcp::socket& socket, TransferSession& session,
                        const std::filesystem::path& part_path);

    std::filesystem::path save_path_;
    std::filesystem::path out_dir_;
    uint32_t chunk_size_;
    uint64_t total_chunks_;
    StartHook on_start_;
    CompleteHook on_complete_;
    ProgressCallback on_progress_;
    std::atomic<bool> cancel_requested_{false};
};

} // namespace transfer
