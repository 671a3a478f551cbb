#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace protocol {

// Datagrams that do not start with this prefix are not ours.
constexpr const char* ANNOUNCE_PREFIX = "LANBEAM|";
constexpr std::size_t MAX_ANNOUNCE_SIZE = 1024;

struct Announce {
    std::string name;
    unsigned short port;
    int64_t timestamp; // milliseconds since the Unix epoch
};

std::string encode_announce(const Announce& announce);

// Throws DecodeError on anything that is not a well-formed announce.
Announce decode_announce(const std::string& datagram);

// Discovery is best-effort: malformed datagrams are simply absent.
std::optional<Announce> try_decode_announce(const std::string& datagram);

int64_t now_millis();

} // namespace protocol
