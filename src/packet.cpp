#include "protocol/packet.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace protocol {

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header) {
    std::array<uint8_t, HEADER_SIZE> buffer;
    uint32_t cmd = htonl(header.command);
    uint32_t payload = htonl(header.payload_size);
    uint32_t session = htonl(header.session_id);
    uint32_t seq = htonl(header.sequence);

    std::memcpy(buffer.data(), &cmd, 4);
    std::memcpy(buffer.data() + 4, &payload, 4);
    std::memcpy(buffer.data() + 8, &session, 4);
    std::memcpy(buffer.data() + 12, &seq, 4);

    return buffer;
}

PacketHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer) {
    PacketHeader header;
    uint32_t cmd, payload, session, seq;

    std::memcpy(&cmd, buffer.data(), 4);
    std::memcpy(&payload, buffer.data() + 4, 4);
    std::memcpy(&session, buffer.data() + 8, 4);
    std::memcpy(&seq, buffer.data() + 12, 4);

    header.command = ntohl(cmd);
    header.payload_size = ntohl(payload);
    header.session_id = ntohl(session);
    header.sequence = ntohl(seq);

    if (!is_known_command(header.command)) {
        throw DecodeError("unknown command " + std::to_string(header.command));
    }
    return header;
}

bool is_known_command(uint32_t command) {
    return command >= static_cast<uint32_t>(CommandType::OFFER) &&
           command <= static_cast<uint32_t>(CommandType::COMPLETE);
}

const char* command_name(uint32_t command) {
    switch (static_cast<CommandType>(command)) {
        case CommandType::OFFER: return "OFFER";
        case CommandType::ACCEPT: return "ACCEPT";
        case CommandType::REJECT: return "REJECT";
        case CommandType::CHUNK: return "CHUNK";
        case CommandType::CANCEL: return "CANCEL";
        case CommandType::COMPLETE: return "COMPLETE";
    }
    return "UNKNOWN";
}

} // namespace protocol
