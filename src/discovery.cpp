#include "discovery.hpp"
#include <iostream>
#include <array>

namespace networking {

namespace {

// Receive loop poll period while no datagram is pending
constexpr std::chrono::milliseconds POLL_INTERVAL{50};

RegistryConfig with_self(RegistryConfig config, const AnnouncerConfig& announcer) {
    if (announcer.control_port != 0) {
        config.self = SelfIdentity{announcer.name, announcer.control_port};
    }
    return config;
}

std::string get_local_ip(boost::asio::io_context& io_context) {
    try {
        // Connecting a UDP socket sends nothing; it only selects the outbound interface.
        boost::asio::ip::udp::socket socket(io_context);
        socket.connect(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("8.8.8.8"), 53));
        return socket.local_endpoint().address().to_string();
    } catch (std::exception&) {
        return "127.0.0.1";
    }
}

} // namespace

// ─── Announcer ──────────────────────────────────────────────────────────────

Announcer::Announcer(AnnouncerConfig config) : config_(std::move(config)) {}

Announcer::~Announcer() {
    stop();
}

void Announcer::start() {
    if (running_) return;

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.target_addr, ec);
    if (ec) {
        throw std::invalid_argument("Announcer: bad target address '" + config_.target_addr + "'");
    }
    if (config_.name.empty()) {
        throw std::invalid_argument("Announcer: node name must not be empty");
    }
    target_ = boost::asio::ip::udp::endpoint(address, config_.target_port);

    socket_ = std::make_unique<boost::asio::ip::udp::socket>(io_context_);
    socket_->open(target_.protocol());
    socket_->set_option(boost::asio::socket_base::broadcast(true));

    running_ = true;
    thread_ = std::thread([this]() { run(); });
}

void Announcer::run() {
    try {
        while (running_) {
            protocol::Announce announce{config_.name, config_.control_port, protocol::now_millis()};
            std::string message = protocol::encode_announce(announce);

            // Lost datagrams are superseded by the next tick.
            boost::system::error_code ec;
            socket_->send_to(boost::asio::buffer(message), target_, 0, ec);
            if (!ec) {
                ++sent_;
            }

            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, config_.interval, [this]() { return !running_; });
        }
    } catch (std::exception& e) {
        std::cerr << "Announcer Exception: " << e.what() << "\n";
    }
}

void Announcer::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (socket_) {
        boost::system::error_code ignored;
        socket_->close(ignored);
        socket_.reset();
    }
}

// ─── Peer Registry ──────────────────────────────────────────────────────────

PeerRegistry::PeerRegistry(RegistryConfig config) : config_(std::move(config)) {}

PeerRegistry::~PeerRegistry() {
    stop();
}

void PeerRegistry::start() {
    if (running_) return;

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.bind_addr, ec);
    if (ec) {
        throw BindError("PeerRegistry: bad bind address '" + config_.bind_addr + "'");
    }
    boost::asio::ip::udp::endpoint endpoint(address, config_.bind_port);

    auto socket = std::make_unique<boost::asio::ip::udp::socket>(io_context_);
    socket->open(endpoint.protocol(), ec);
    if (!ec) socket->set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) socket->bind(endpoint, ec);
    if (ec) {
        throw BindError("PeerRegistry: cannot bind " + config_.bind_addr + ":" +
                        std::to_string(config_.bind_port) + ": " + ec.message());
    }

    // Non-blocking so the loop can check running_ periodically
    socket->non_blocking(true);
    port_ = socket->local_endpoint().port();
    socket_ = std::move(socket);
    local_ip_ = get_local_ip(io_context_);

    running_ = true;
    thread_ = std::thread([this]() { run(); });
}

void PeerRegistry::run() {
    try {
        std::array<char, protocol::MAX_ANNOUNCE_SIZE + 1> recv_buf;
        while (running_) {
            boost::asio::ip::udp::endpoint sender_endpoint;
            boost::system::error_code ec;

            size_t len = socket_->receive_from(
                boost::asio::buffer(recv_buf), sender_endpoint, 0, ec);

            if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
                std::this_thread::sleep_for(POLL_INTERVAL);
                continue;
            }
            if (ec) {
                // Persistent errors must not spin the loop
                std::this_thread::sleep_for(POLL_INTERVAL);
                continue;
            }

            handle_datagram(std::string(recv_buf.data(), len), sender_endpoint.address().to_string());
        }
    } catch (std::exception& e) {
        std::cerr << "PeerRegistry Exception: " << e.what() << "\n";
    }
}

void PeerRegistry::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (socket_) {
        boost::system::error_code ignored;
        socket_->close(ignored);
        socket_.reset();
    }
}

bool PeerRegistry::handle_datagram(const std::string& datagram, const std::string& address) {
    auto announce = protocol::try_decode_announce(datagram);
    if (!announce) return false;
    if (is_own_announce(*announce, address)) return false;
    record_announce(*announce, address);
    return true;
}

bool PeerRegistry::is_own_announce(const protocol::Announce& announce, const std::string& address) const {
    const SelfIdentity& self = config_.self;
    if (self.name.empty() || announce.name != self.name || announce.port != self.control_port) {
        return false;
    }
    boost::system::error_code ec;
    auto sender = boost::asio::ip::make_address(address, ec);
    if (ec) return false;
    return sender.is_loopback() || sender.is_unspecified() || address == local_ip_;
}

void PeerRegistry::record_announce(const protocol::Announce& announce, const std::string& address,
                                   Clock::time_point now) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    PeerRecord& record = peers_[peer_key(announce.name, address, announce.port)];
    record.name = announce.name;
    record.address = address;
    record.port = announce.port;
    record.announced_at = announce.timestamp;
    if (now > record.last_seen) {
        record.last_seen = now;
    }
}

PeerRegistry::PeerMap PeerRegistry::get_peers() {
    return get_peers(Clock::now());
}

PeerRegistry::PeerMap PeerRegistry::get_peers(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    for (auto it = peers_.begin(); it != peers_.end();) {
        if (now - it->second.last_seen > config_.eviction_window) {
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }
    return peers_;
}

std::string PeerRegistry::peer_key(const std::string& name, const std::string& address,
                                   unsigned short port) {
    return name + "@" + address + ":" + std::to_string(port);
}

// ─── Discovery Manager ──────────────────────────────────────────────────────

DiscoveryManager::DiscoveryManager(AnnouncerConfig announcer, RegistryConfig registry)
    : announce_(announcer.control_port != 0),
      announcer_(announcer),
      registry_(with_self(std::move(registry), announcer)) {}

void DiscoveryManager::start() {
    registry_.start();
    if (!announce_) return;
    try {
        announcer_.start();
    } catch (...) {
        registry_.stop();
        throw;
    }
}

void DiscoveryManager::stop() {
    announcer_.stop();
    registry_.stop();
}

PeerRegistry::PeerMap discover_peers(const RegistryConfig& config, std::chrono::milliseconds wait) {
    PeerRegistry registry(config);
    registry.start();
    std::this_thread::sleep_for(wait);
    auto peers = registry.get_peers();
    registry.stop();
    return peers;
}

} // namespace networking
