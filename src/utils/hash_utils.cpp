/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 hashing and random identifiers via OpenSSL
 *
 * **Thread Safety**:
 * All functions are thread-safe and reentrant.
 *
 * @date 2025
 */

#include "wasmbox/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace wasmbox {
namespace utils {

std::string HashUtils::ToHex(const std::uint8_t* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// ============================================================================
// SHA-256
// ============================================================================

std::string HashUtils::ComputeSHA256(const std::vector<std::uint8_t>& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), digest);
    return ToHex(digest, SHA256_DIGEST_LENGTH);
}

// ============================================================================
// RANDOM IDENTIFIERS
// ============================================================================

bool HashUtils::FillRandom(std::uint8_t* buffer, std::size_t length) {
    if (length == 0) {
        return true;
    }
    return RAND_bytes(buffer, static_cast<int>(length)) == 1;
}

std::string HashUtils::GenerateRandomHex(std::size_t num_bytes) {
    std::vector<std::uint8_t> bytes(num_bytes);
    if (!FillRandom(bytes.data(), bytes.size())) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return ToHex(bytes.data(), bytes.size());
}

std::string HashUtils::GenerateSessionId() {
    std::uint8_t bytes[16];
    if (!FillRandom(bytes, sizeof(bytes))) {
        spdlog::error("Failed to draw random bytes for session id");
        throw std::runtime_error("RAND_bytes failed");
    }

    // RFC 4122 version 4, variant 10xx
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string hex = ToHex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace utils
} // namespace wasmbox
