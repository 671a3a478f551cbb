#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

constexpr const char* CHECKSUM_SHA256 = "sha256";

// Receivers allocate one chunk up front; offers above this are refused.
constexpr uint32_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

// First message on a control connection. Immutable once built.
struct Offer {
    std::string filename;
    uint64_t total_size = 0;
    uint64_t total_chunks = 0;
    uint32_t chunk_size = 0;
    std::string checksum = CHECKSUM_SHA256;
};

// Number of chunks needed for total_size bytes (0 for an empty file).
uint64_t chunk_count(uint64_t total_size, uint32_t chunk_size);

// Byte length of chunk `index`; every chunk is full except possibly the last.
uint32_t chunk_length(const Offer& offer, uint64_t index);

// Builds a consistent offer. Throws DecodeError on arguments a peer would refuse.
Offer make_offer(const std::string& filename, uint64_t total_size, uint32_t chunk_size);

// Throws DecodeError if the offer is not internally consistent.
void validate_offer(const Offer& offer);

void to_json(nlohmann::json& j, const Offer& offer);
// Strict: every field required, no unknown keys.
void from_json(const nlohmann::json& j, Offer& offer);

std::string encode_offer(const Offer& offer);
Offer decode_offer(const std::string& payload);

// Payload of REJECT
struct RejectInfo {
    std::string reason;
};

// Payload of COMPLETE
struct CompleteInfo {
    std::string sha256;
    bool ok;
    uint64_t bytes;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RejectInfo, reason)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CompleteInfo, sha256, ok, bytes)

std::string encode_reject(const RejectInfo& info);
RejectInfo decode_reject(const std::string& payload);

std::string encode_complete(const CompleteInfo& info);
CompleteInfo decode_complete(const std::string& payload);

} // namespace protocol
