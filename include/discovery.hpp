#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <boost/asio.hpp>
#include "protocol/announce.hpp"

namespace networking {

constexpr unsigned short DEFAULT_DISCOVERY_PORT = 37020;
constexpr std::chrono::milliseconds DEFAULT_ANNOUNCE_INTERVAL{1000};
constexpr int DEFAULT_EVICTION_MULTIPLIER = 3;

// A listening socket could not be bound.
class BindError : public std::runtime_error {
public:
    explicit BindError(const std::string& what) : std::runtime_error(what) {}
};

// ─── Announcer ──────────────────────────────────────────────────────────────

struct AnnouncerConfig {
    std::string name;
    unsigned short control_port = 0;
    std::string target_addr = "255.255.255.255";
    unsigned short target_port = DEFAULT_DISCOVERY_PORT;
    std::chrono::milliseconds interval = DEFAULT_ANNOUNCE_INTERVAL;
};

class Announcer {
public:
    explicit Announcer(AnnouncerConfig config);
    ~Announcer();

    Announcer(const Announcer&) = delete;
    Announcer& operator=(const Announcer&) = delete;

    // No-op if already running. Throws std::invalid_argument on a bad target.
    void start();
    void stop();
    bool is_running() const { return running_; }

    // Datagrams handed to the network so far
    uint64_t announcements_sent() const { return sent_; }

private:
    void run();

    AnnouncerConfig config_;
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::udp::socket> socket_;
    boost::asio::ip::udp::endpoint target_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sent_{0};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

// ─── Peer Registry ──────────────────────────────────────────────────────────

struct PeerRecord {
    std::string name;
    std::string address;
    unsigned short port;
    std::chrono::steady_clock::time_point last_seen;
    int64_t announced_at; // sender's clock, ms since epoch
};

// How a node recognises its own announcements. Names are not unique, so a
// datagram only counts as ours if name and control port match and it came
// from one of this host's addresses.
struct SelfIdentity {
    std::string name;
    unsigned short control_port = 0;
};

struct RegistryConfig {
    std::string bind_addr = "0.0.0.0";
    unsigned short bind_port = DEFAULT_DISCOVERY_PORT;
    std::chrono::milliseconds eviction_window = DEFAULT_ANNOUNCE_INTERVAL * DEFAULT_EVICTION_MULTIPLIER;
    // Empty name: nothing is filtered
    SelfIdentity self;
};

class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using PeerMap = std::map<std::string, PeerRecord>;

    explicit PeerRegistry(RegistryConfig config);
    ~PeerRegistry();

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // Throws BindError if the socket cannot be bound.
    void start();
    void stop();
    bool is_running() const { return running_; }
    unsigned short port() const { return port_; }

    // Live peers keyed by peer_key(); stale entries are evicted on the way.
    PeerMap get_peers();
    PeerMap get_peers(Clock::time_point now);

    void record_announce(const protocol::Announce& announce, const std::string& address,
                         Clock::time_point now = Clock::now());

    // Returns false if the datagram was dropped.
    bool handle_datagram(const std::string& datagram, const std::string& address);

    bool is_own_announce(const protocol::Announce& announce, const std::string& address) const;

    // "name@address:port"; nodes sharing a name and a host stay apart.
    static std::string peer_key(const std::string& name, const std::string& address, unsigned short port);

private:
    void run();

    RegistryConfig config_;
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::udp::socket> socket_;
    std::atomic<unsigned short> port_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;
    // Outbound interface address, resolved in start()
    std::string local_ip_;

    std::mutex peers_mutex_;
    PeerMap peers_;
};

// ─── Discovery Manager ──────────────────────────────────────────────────────

// One node's view of discovery: announces itself (unless control_port is 0)
// and lists every other node, including nodes that share its name.
class DiscoveryManager {
public:
    DiscoveryManager(AnnouncerConfig announcer, RegistryConfig registry);

    void start();
    void stop();
    bool is_running() const { return registry_.is_running(); }

    PeerRegistry::PeerMap get_peers() { return registry_.get_peers(); }
    unsigned short listen_port() const { return registry_.port(); }

private:
    bool announce_;
    Announcer announcer_;
    PeerRegistry registry_;
};

// Listens for `wait` and returns whatever was heard.
PeerRegistry::PeerMap discover_peers(const RegistryConfig& config, std::chrono::milliseconds wait);

} // namespace networking
