#include "protocol/offer.hpp"
#include "protocol/packet.hpp"
#include <limits>

namespace protocol {

namespace {

const char* const OFFER_KEYS[] = {"filename", "total_size", "total_chunks", "chunk_size", "checksum"};

bool is_offer_key(const std::string& key) {
    for (const char* k : OFFER_KEYS) {
        if (key == k) return true;
    }
    return false;
}

nlohmann::json parse_object(const std::string& payload, const char* what) {
    nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw DecodeError(std::string(what) + ": payload is not a JSON object");
    }
    return j;
}

} // namespace

uint64_t chunk_count(uint64_t total_size, uint32_t chunk_size) {
    if (chunk_size == 0) return 0;
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

uint32_t chunk_length(const Offer& offer, uint64_t index) {
    if (index >= offer.total_chunks) return 0;
    uint64_t start = index * offer.chunk_size;
    uint64_t remaining = offer.total_size - start;
    return static_cast<uint32_t>(remaining < offer.chunk_size ? remaining : offer.chunk_size);
}

Offer make_offer(const std::string& filename, uint64_t total_size, uint32_t chunk_size) {
    Offer offer;
    offer.filename = filename;
    offer.total_size = total_size;
    offer.chunk_size = chunk_size;
    offer.total_chunks = chunk_count(total_size, chunk_size);
    offer.checksum = CHECKSUM_SHA256;
    validate_offer(offer);
    return offer;
}

void validate_offer(const Offer& offer) {
    const std::string& name = offer.filename;
    if (name.empty() || name == "." || name == "..") {
        throw DecodeError("offer: invalid filename '" + name + "'");
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
        name.find('\0') != std::string::npos) {
        throw DecodeError("offer: filename must not contain a path: '" + name + "'");
    }
    if (offer.chunk_size == 0) {
        throw DecodeError("offer: chunk_size must be positive");
    }
    if (offer.chunk_size > MAX_CHUNK_SIZE) {
        throw DecodeError("offer: chunk_size " + std::to_string(offer.chunk_size) + " exceeds " +
                          std::to_string(MAX_CHUNK_SIZE));
    }
    if (offer.total_chunks != chunk_count(offer.total_size, offer.chunk_size)) {
        throw DecodeError("offer: total_chunks " + std::to_string(offer.total_chunks) +
                          " does not match total_size " + std::to_string(offer.total_size));
    }
    // The chunk index travels in a 32-bit header field.
    if (offer.total_chunks > std::numeric_limits<uint32_t>::max()) {
        throw DecodeError("offer: too many chunks");
    }
    if (offer.checksum != CHECKSUM_SHA256) {
        throw DecodeError("offer: unsupported checksum '" + offer.checksum + "'");
    }
}

void to_json(nlohmann::json& j, const Offer& offer) {
    j = nlohmann::json{
        {"filename", offer.filename},
        {"total_size", offer.total_size},
        {"total_chunks", offer.total_chunks},
        {"chunk_size", offer.chunk_size},
        {"checksum", offer.checksum}
    };
}

void from_json(const nlohmann::json& j, Offer& offer) {
    if (!j.is_object()) {
        throw DecodeError("offer: expected a JSON object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_offer_key(it.key())) {
            throw DecodeError("offer: unknown field '" + it.key() + "'");
        }
    }
    for (const char* key : OFFER_KEYS) {
        if (!j.contains(key)) {
            throw DecodeError(std::string("offer: missing field '") + key + "'");
        }
    }
    if (!j["filename"].is_string() || !j["checksum"].is_string()) {
        throw DecodeError("offer: filename and checksum must be strings");
    }
    if (!j["total_size"].is_number_unsigned() || !j["total_chunks"].is_number_unsigned() ||
        !j["chunk_size"].is_number_unsigned()) {
        throw DecodeError("offer: sizes must be non-negative integers");
    }
    uint64_t chunk_size = j["chunk_size"].get<uint64_t>();
    if (chunk_size > std::numeric_limits<uint32_t>::max()) {
        throw DecodeError("offer: chunk_size out of range");
    }

    offer.filename = j["filename"].get<std::string>();
    offer.total_size = j["total_size"].get<uint64_t>();
    offer.total_chunks = j["total_chunks"].get<uint64_t>();
    offer.chunk_size = static_cast<uint32_t>(chunk_size);
    offer.checksum = j["checksum"].get<std::string>();
}

std::string encode_offer(const Offer& offer) {
    nlohmann::json j = offer;
    return j.dump();
}

Offer decode_offer(const std::string& payload) {
    nlohmann::json j = parse_object(payload, "offer");
    Offer offer = j.get<Offer>();
    validate_offer(offer);
    return offer;
}

std::string encode_reject(const RejectInfo& info) {
    nlohmann::json j = info;
    return j.dump();
}

RejectInfo decode_reject(const std::string& payload) {
    nlohmann::json j = parse_object(payload, "reject");
    try {
        return j.get<RejectInfo>();
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("reject: ") + e.what());
    }
}

std::string encode_complete(const CompleteInfo& info) {
    nlohmann::json j = info;
    return j.dump();
}

CompleteInfo decode_complete(const std::string& payload) {
    nlohmann::json j = parse_object(payload, "complete");
    try {
        return j.get<CompleteInfo>();
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("complete: ") + e.what());
    }
}

} // namespace protocol
