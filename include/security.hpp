#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <array>
#include <filesystem>
#include <sodium.h>

namespace security {

constexpr std::size_t SHA256_BYTES = crypto_hash_sha256_BYTES; // 32

// Initialise libsodium once; throws std::runtime_error if it cannot be.
void ensure_sodium();

// Random non-zero 32-bit session identifier from libsodium's CSPRNG
uint32_t generate_session_id();

// Incremental SHA-256 over a byte stream (crypto_hash_sha256_*)
class Sha256 {
public:
    Sha256();
    void update(const void* data, std::size_t size);
    // Returns the digest as lowercase hex. The hasher is spent afterwards.
    std::string finish_hex();

private:
    crypto_hash_sha256_state state_;
    bool finished_ = false;
};

std::string to_hex(const unsigned char* data, std::size_t size);

// SHA-256 of a whole file as lowercase hex; throws std::runtime_error if unreadable.
std::string sha256_file(const std::filesystem::path& path);

std::string sha256_hex(const std::string& data);

} // namespace security
