#pragma once

#include <cstdint>
#include <array>
#include <stdexcept>
#include <string>

namespace protocol {

enum class CommandType : uint32_t {
    OFFER = 1,
    ACCEPT = 2,
    REJECT = 3,
    CHUNK = 4,
    CANCEL = 5,
    COMPLETE = 6
};

constexpr std::size_t HEADER_SIZE = 16;

// Offers and status replies are small JSON documents.
constexpr uint32_t MAX_CONTROL_PAYLOAD = 64 * 1024;

// Fixed 16-byte header
struct PacketHeader {
    uint32_t command;      // 4 bytes
    uint32_t payload_size; // 4 bytes
    uint32_t session_id;   // 4 bytes
    uint32_t sequence;     // 4 bytes, chunk index for CHUNK
};

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header);
PacketHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer);

bool is_known_command(uint32_t command);
const char* command_name(uint32_t command);

inline PacketHeader make_header(CommandType command, uint32_t payload_size = 0,
                                uint32_t session_id = 0, uint32_t sequence = 0) {
    return PacketHeader{static_cast<uint32_t>(command), payload_size, session_id, sequence};
}

inline bool is_command(const PacketHeader& header, CommandType command) {
    return header.command == static_cast<uint32_t>(command);
}

} // namespace protocol
