#include "security.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace security {

void ensure_sodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

uint32_t generate_session_id() {
    ensure_sodium();
    uint32_t id = 0;
    while (id == 0) {
        id = randombytes_random();
    }
    return id;
}

Sha256::Sha256() {
    ensure_sodium();
    crypto_hash_sha256_init(&state_);
}

void Sha256::update(const void* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Sha256::update after finish_hex");
    }
    crypto_hash_sha256_update(&state_, static_cast<const unsigned char*>(data), size);
}

std::string Sha256::finish_hex() {
    if (finished_) {
        throw std::logic_error("Sha256::finish_hex called twice");
    }
    unsigned char hash[SHA256_BYTES];
    crypto_hash_sha256_final(&state_, hash);
    finished_ = true;
    return to_hex(hash, sizeof(hash));
}

std::string to_hex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for hashing: " + path.string());
    }

    Sha256 hasher;
    std::vector<char> buffer(64 * 1024);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        hasher.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing: " + path.string());
    }
    return hasher.finish_hex();
}

std::string sha256_hex(const std::string& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish_hex();
}

} // namespace security
