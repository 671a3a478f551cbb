#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "discovery.hpp"
#include "networking.hpp"
#include "transfer.hpp"

namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Settings for one node. Every field has a usable default.
struct NodeConfig {
    std::string name = "lanbeam";

    // discovery
    std::string discovery_bind_addr = "0.0.0.0";
    unsigned short discovery_port = networking::DEFAULT_DISCOVERY_PORT;
    std::string announce_target = "255.255.255.255";
    std::chrono::milliseconds announce_interval = networking::DEFAULT_ANNOUNCE_INTERVAL;
    int eviction_multiplier = networking::DEFAULT_EVICTION_MULTIPLIER;

    // control channel
    std::string control_bind_addr = "0.0.0.0";
    unsigned short control_port = networking::DEFAULT_CONTROL_PORT;
    uint32_t chunk_size = transfer::DEFAULT_CHUNK_SIZE;
    std::chrono::milliseconds handshake_timeout = networking::DEFAULT_HANDSHAKE_TIMEOUT;

    // receive side
    std::filesystem::path receive_dir = "received";
};

// Missing keys keep their defaults; wrong types and bad values throw ConfigError.
NodeConfig parse_config(const nlohmann::json& j);
NodeConfig load_config(const std::filesystem::path& path);

networking::AnnouncerConfig announcer_config(const NodeConfig& config, unsigned short control_port);
// control_port identifies our own announcements; pass the port the control
// server actually bound.
networking::RegistryConfig registry_config(const NodeConfig& config, unsigned short control_port);
networking::ControlServerConfig control_server_config(const NodeConfig& config);

} // namespace config
