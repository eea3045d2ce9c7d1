/**
 * @file hash_utils.hpp
 * @brief SHA-256 digest helpers used for content hashing and audit signatures
 *
 * The gateway never stores raw content. Every request is identified by the
 * SHA-256 of its content, and every persisted audit record carries a SHA-256
 * signature over its canonical JSON form.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace warden {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed digest utilities
 *
 * All methods are static and thread-safe.
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256("x = 1");
 * // 64 lowercase hex characters
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of an in-memory string
     * @param data Bytes to hash
     * @return Lowercase hexadecimal digest (64 chars)
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Compute SHA-256 of a file, streamed in 8KB chunks
     * @param file_path File to hash
     * @return Lowercase hexadecimal digest
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeFileSHA256(const std::filesystem::path& file_path);

    /**
     * @brief Compare two digests without early exit
     * @return true if equal (case-insensitive)
     */
    static bool ConstantTimeEquals(const std::string& a, const std::string& b);

    /**
     * @brief Check that a string looks like a SHA-256 hex digest
     */
    static bool IsSHA256Hex(const std::string& value);
};

} // namespace utils
} // namespace warden
