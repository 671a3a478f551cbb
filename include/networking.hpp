#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <memory>
#include <list>
#include <mutex>
#include <thread>
#include <atomic>
#include <filesystem>
#include <boost/asio.hpp>
#include "discovery.hpp"
#include "handshake.hpp"
#include "transfer.hpp"

namespace networking {

constexpr unsigned short DEFAULT_CONTROL_PORT = 60000;

// Decides where an offered file goes. Returning nullptr rejects the offer;
// throwing rejects it with the exception text as the reason.
using OfferHandler = std::function<std::unique_ptr<transfer::Receiver>(const protocol::Offer&)>;

struct ControlServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = DEFAULT_CONTROL_PORT; // 0 picks an ephemeral port
};

class ControlServer {
public:
    ControlServer(ControlServerConfig config, OfferHandler handler);
    // Waits for connections still in progress.
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Throws BindError if the port cannot be bound.
    void start();
    // Stops accepting; connections already being served run to completion.
    void stop();
    bool is_running() const { return running_; }

    unsigned short port() const { return port_; }
    std::size_t active_sessions() const { return active_; }

private:
    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void serve(boost::asio::ip::tcp::socket socket);
    void reap_connections(bool wait_all);

    ControlServerConfig config_;
    OfferHandler handler_;
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::atomic<unsigned short> port_{0};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> active_{0};
    std::thread accept_thread_;

    std::mutex connections_mutex_;
    std::list<Connection> connections_;
};

// Free bytes on the filesystem holding `dir`; 0 if unknown.
uint64_t available_space(const std::filesystem::path& dir);

} // namespace networking
