#include "config.hpp"
#include "protocol/offer.hpp"
#include <fstream>
#include <limits>

namespace config {

namespace {

template <typename T>
void read_field(const nlohmann::json& section, const char* section_name, const char* key, T& out) {
    if (!section.contains(key)) return;
    try {
        out = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string(section_name) + "." + key + ": " + e.what());
    }
}

void read_port(const nlohmann::json& section, const char* section_name, const char* key,
               unsigned short& out) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<unsigned short>::max()) {
        throw ConfigError(std::string(section_name) + "." + key + ": not a valid port");
    }
    out = static_cast<unsigned short>(value.get<uint64_t>());
}

void read_millis(const nlohmann::json& section, const char* section_name, const char* key,
                 std::chrono::milliseconds& out) {
    if (!section.contains(key)) return;
    const auto& value = section.at(key);
    if (!value.is_number_unsigned() || value.get<uint64_t>() == 0) {
        throw ConfigError(std::string(section_name) + "." + key + ": must be a positive integer");
    }
    out = std::chrono::milliseconds(value.get<uint64_t>());
}

const nlohmann::json& section(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!root.contains(name)) return empty;
    const auto& s = root.at(name);
    if (!s.is_object()) {
        throw ConfigError(std::string(name) + ": expected an object");
    }
    return s;
}

} // namespace

NodeConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    NodeConfig cfg;
    const auto& node = section(j, "node");
    read_field(node, "node", "name", cfg.name);
    if (cfg.name.empty()) {
        throw ConfigError("node.name must not be empty");
    }

    const auto& discovery = section(j, "discovery");
    read_field(discovery, "discovery", "bind_addr", cfg.discovery_bind_addr);
    read_port(discovery, "discovery", "port", cfg.discovery_port);
    read_field(discovery, "discovery", "target_addr", cfg.announce_target);
    read_millis(discovery, "discovery", "interval_ms", cfg.announce_interval);
    read_field(discovery, "discovery", "eviction_multiplier", cfg.eviction_multiplier);
    if (cfg.eviction_multiplier < 1) {
        throw ConfigError("discovery.eviction_multiplier must be at least 1");
    }

    const auto& control = section(j, "control");
    read_field(control, "control", "bind_addr", cfg.control_bind_addr);
    read_port(control, "control", "port", cfg.control_port);
    if (control.contains("chunk_size")) {
        const auto& value = control.at("chunk_size");
        if (!value.is_number_unsigned() || value.get<uint64_t>() == 0 ||
            value.get<uint64_t>() > protocol::MAX_CHUNK_SIZE) {
            throw ConfigError("control.chunk_size must be between 1 and " +
                              std::to_string(protocol::MAX_CHUNK_SIZE));
        }
        cfg.chunk_size = static_cast<uint32_t>(value.get<uint64_t>());
    }
    read_millis(control, "control", "handshake_timeout_ms", cfg.handshake_timeout);

    const auto& receive = section(j, "receive");
    std::string dir = cfg.receive_dir.string();
    read_field(receive, "receive", "directory", dir);
    cfg.receive_dir = dir;

    return cfg;
}

NodeConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path.string());
    }
    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("Config file is not valid JSON: " + path.string());
    }
    return parse_config(j);
}

networking::AnnouncerConfig announcer_config(const NodeConfig& config, unsigned short control_port) {
    networking::AnnouncerConfig out;
    out.name = config.name;
    out.control_port = control_port;
    out.target_addr = config.announce_target;
    out.target_port = config.discovery_port;
    out.interval = config.announce_interval;
    return out;
}

networking::RegistryConfig registry_config(const NodeConfig& config, unsigned short control_port) {
    networking::RegistryConfig out;
    out.bind_addr = config.discovery_bind_addr;
    out.bind_port = config.discovery_port;
    out.eviction_window = config.announce_interval * config.eviction_multiplier;
    out.self = networking::SelfIdentity{config.name, control_port};
    return out;
}

networking::ControlServerConfig control_server_config(const NodeConfig& config) {
    networking::ControlServerConfig out;
    out.host = config.control_bind_addr;
    out.port = config.control_port;
    return out;
}

} // namespace config
