/**
 * @file hash_utils.hpp
 * @brief OpenSSL backed hashing and random identifier generation
 *
 * SHA-256 digests key the instrumented module cache. Session identifiers and
 * temp-file suffixes are drawn from the OpenSSL CSPRNG.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace wasmbox {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers
 *
 * **Example Usage**:
 * @code
 * std::string key = HashUtils::ComputeSHA256(module_bytes);
 * std::string id  = HashUtils::GenerateSessionId();  // "3f2b...-4...-..."
 * @endcode
 *
 * **Error Handling**:
 * - CSPRNG failures throw std::runtime_error
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of an in-memory buffer
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::vector<std::uint8_t>& data);

    /**
     * @brief Random UUIDv4 in canonical text form
     * @throws std::runtime_error if RAND_bytes fails
     */
    static std::string GenerateSessionId();

    /**
     * @brief Random lowercase hex string of 2 * num_bytes characters
     */
    static std::string GenerateRandomHex(std::size_t num_bytes);

    /**
     * @brief Fill a buffer with CSPRNG output
     * @return false if OpenSSL could not provide randomness
     */
    static bool FillRandom(std::uint8_t* buffer, std::size_t length);

    /**
     * @brief Convert bytes to lowercase hex
     */
    static std::string ToHex(const std::uint8_t* data, std::size_t length);
};

} // namespace utils
} // namespace wasmbox
