/**
 * @file hash_utils.hpp
 * @brief SHA-256 checksums and random identifiers
 *
 * Checksums are attached to every file transfer so callers can verify what
 * landed in (or came out of) a sandbox. Identifiers for sandboxes and tasks
 * come from the OpenSSL CSPRNG.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>
#include <cstddef>

namespace sandcastle {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed hashing helpers
 *
 * **Thread Safety**: all methods are static and reentrant.
 *
 * @code
 * auto digest = HashUtils::ComputeSHA256(std::string("hello"));
 * auto id = HashUtils::GenerateId("sbx");   // "sbx-3f9c0a1b2d4e"
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of an in-memory buffer, lowercase hex
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief SHA-256 of a host file, streamed in 8KB chunks
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief @p byte_count random bytes as lowercase hex
     * @throws std::runtime_error if the CSPRNG fails
     */
    static std::string RandomHex(std::size_t byte_count);

    /**
     * @brief "<prefix>-<12 hex chars>"
     */
    static std::string GenerateId(const std::string& prefix, std::size_t byte_count = 6);
};

} // namespace utils
} // namespace sandcastle
