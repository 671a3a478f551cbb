#include "networking.hpp"
#include "security.hpp"
#include "protocol/packet.hpp"
#include "protocol/offer.hpp"
#include <iostream>
#include <chrono>

#ifdef _WIN32
  #include <windows.h>
#else
  #include <sys/statvfs.h>
#endif

using boost::asio::ip::tcp;

namespace networking {

namespace {

constexpr std::chrono::milliseconds ACCEPT_POLL_INTERVAL{50};

} // namespace

uint64_t available_space(const std::filesystem::path& dir) {
    std::filesystem::path probe = dir.empty() ? std::filesystem::path(".") : dir;
    // The directory may not exist yet; measure the closest existing ancestor.
    std::error_code ec;
    while (!std::filesystem::exists(probe, ec) && probe.has_parent_path() && probe != probe.parent_path()) {
        probe = probe.parent_path();
    }
    uint64_t available = 0;
#ifdef _WIN32
    ULARGE_INTEGER free_bytes;
    if (GetDiskFreeSpaceExA(probe.string().c_str(), &free_bytes, nullptr, nullptr)) {
        available = free_bytes.QuadPart;
    }
#else
    struct statvfs disk_stat;
    if (statvfs(probe.string().c_str(), &disk_stat) == 0) {
        available = static_cast<uint64_t>(disk_stat.f_bavail) * disk_stat.f_frsize;
    }
#endif
    return available;
}

// ─── ControlServer ──────────────────────────────────────────────────────────

ControlServer::ControlServer(ControlServerConfig config, OfferHandler handler)
    : config_(std::move(config)), handler_(std::move(handler)) {}

ControlServer::~ControlServer() {
    stop();
    reap_connections(true);
}

void ControlServer::start() {
    if (running_) return;

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.host, ec);
    if (ec) {
        throw BindError("ControlServer: bad bind address '" + config_.host + "'");
    }
    tcp::endpoint endpoint(address, config_.port);

    auto acceptor = std::make_unique<tcp::acceptor>(io_context_);
    acceptor->open(endpoint.protocol(), ec);
    if (!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor->bind(endpoint, ec);
    if (!ec) acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw BindError("ControlServer: cannot listen on " + config_.host + ":" +
                        std::to_string(config_.port) + ": " + ec.message());
    }

    // Non-blocking so stop() is honoured between polls
    acceptor->non_blocking(true);
    port_ = acceptor->local_endpoint().port();
    acceptor_ = std::move(acceptor);

    running_ = true;
    accept_thread_ = std::thread([this]() { accept_loop(); });
    std::cout << "ControlServer listening on " << config_.host << ":" << port_ << "\n";
}

void ControlServer::stop() {
    running_ = false;
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (acceptor_) {
        boost::system::error_code ignored;
        acceptor_->close(ignored);
        acceptor_.reset();
    }
}

void ControlServer::accept_loop() {
    while (running_) {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_->accept(socket, ec);

        if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
            std::this_thread::sleep_for(ACCEPT_POLL_INTERVAL);
            continue;
        }
        if (ec) {
            std::cerr << "ControlServer accept failed: " << ec.message() << "\n";
            // e.g. EMFILE persists until a connection closes
            std::this_thread::sleep_for(ACCEPT_POLL_INTERVAL);
            continue;
        }

        reap_connections(false);

        auto done = std::make_shared<std::atomic<bool>>(false);
        ++active_;
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.push_back(Connection{
            std::thread([this, done](tcp::socket s) {
                serve(std::move(s));
                --active_;
                *done = true;
            }, std::move(socket)),
            done
        });
    }
}

void ControlServer::reap_connections(bool wait_all) {
    std::list<Connection> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (wait_all || it->done->load()) {
                finished.splice(finished.end(), connections_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : finished) {
        if (conn.thread.joinable()) {
            conn.thread.join();
        }
    }
}

void ControlServer::serve(tcp::socket socket) {
    try {
        // --- Offer ---
        protocol::PacketHeader header = transfer::MessageReceiver::receive_header(socket);
        if (!protocol::is_command(header, protocol::CommandType::OFFER)) {
            std::cerr << "ControlServer: expected OFFER, got " << protocol::command_name(header.command) << "\n";
            transfer::MessageSender::send_reject(socket, "expected an offer");
            return;
        }
        if (header.payload_size > protocol::MAX_CONTROL_PAYLOAD) {
            transfer::MessageSender::send_reject(socket, "offer too large");
            return;
        }

        protocol::Offer offer;
        try {
            offer = protocol::decode_offer(transfer::MessageReceiver::receive_payload(socket, header.payload_size));
        } catch (const protocol::DecodeError& e) {
            std::cerr << "ControlServer: malformed offer: " << e.what() << "\n";
            transfer::MessageSender::send_reject(socket, std::string("malformed offer: ") + e.what());
            return;
        }

        transfer::TransferSession session(offer);

        // --- Decision ---
        std::unique_ptr<transfer::Receiver> receiver;
        try {
            receiver = handler_ ? handler_(offer) : nullptr;
        } catch (std::exception& e) {
            session.fail(e.what());
            transfer::MessageSender::send_reject(socket, e.what());
            return;
        }
        if (!receiver) {
            session.fail("rejected by receiver");
            transfer::MessageSender::send_reject(socket, "rejected by receiver");
            return;
        }
        if (!receiver->matches(offer)) {
            std::cerr << "ControlServer: handler's receiver expects " << receiver->total_chunks()
                      << " chunks of " << receiver->chunk_size() << " bytes\n";
            session.fail("receiver does not match offer");
            transfer::MessageSender::send_reject(socket, "receiver does not match offer");
            return;
        }

        uint64_t available = available_space(receiver->save_path().parent_path());
        if (available > 0 && available < offer.total_size) {
            session.fail("insufficient disk space");
            transfer::MessageSender::send_reject(socket, "insufficient disk space");
            return;
        }

        session.accept(security::generate_session_id());
        transfer::MessageSender::send_header(socket,
            protocol::make_header(protocol::CommandType::ACCEPT, 0, session.id()));

        // --- Transfer ---
        transfer::CompleteMeta meta = receiver->handle_offer_and_receive(socket, session);
        if (!meta.ok) {
            std::cerr << "ControlServer: session " << session.id() << " failed: " << meta.error << "\n";
        }
    } catch (std::exception& e) {
        std::cerr << "ControlServer Exception: " << e.what() << "\n";
    }

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

} // namespace networking
