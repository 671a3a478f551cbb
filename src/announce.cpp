#include "protocol/announce.hpp"
#include "protocol/packet.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstring>
#include <limits>

namespace protocol {

std::string encode_announce(const Announce& announce) {
    nlohmann::json j{
        {"name", announce.name},
        {"port", announce.port},
        {"timestamp", announce.timestamp}
    };
    return std::string(ANNOUNCE_PREFIX) + j.dump();
}

Announce decode_announce(const std::string& datagram) {
    const std::size_t prefix_len = std::strlen(ANNOUNCE_PREFIX);
    if (datagram.size() > MAX_ANNOUNCE_SIZE) {
        throw DecodeError("announce: datagram too large");
    }
    if (datagram.compare(0, prefix_len, ANNOUNCE_PREFIX) != 0) {
        throw DecodeError("announce: missing prefix");
    }

    nlohmann::json j = nlohmann::json::parse(datagram.substr(prefix_len), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw DecodeError("announce: body is not a JSON object");
    }
    if (j.size() != 3 || !j.contains("name") || !j.contains("port") || !j.contains("timestamp")) {
        throw DecodeError("announce: expected exactly name, port and timestamp");
    }
    if (!j["name"].is_string() || !j["port"].is_number_unsigned() || !j["timestamp"].is_number_integer()) {
        throw DecodeError("announce: field of wrong type");
    }

    Announce announce;
    announce.name = j["name"].get<std::string>();
    if (announce.name.empty()) {
        throw DecodeError("announce: empty name");
    }
    uint64_t port = j["port"].get<uint64_t>();
    if (port == 0 || port > std::numeric_limits<unsigned short>::max()) {
        throw DecodeError("announce: port out of range");
    }
    announce.port = static_cast<unsigned short>(port);
    announce.timestamp = j["timestamp"].get<int64_t>();
    return announce;
}

std::optional<Announce> try_decode_announce(const std::string& datagram) {
    try {
        return decode_announce(datagram);
    } catch (const DecodeError&) {
        return std::nullopt;
    }
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace protocol
