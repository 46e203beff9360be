/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 checksums and random identifiers
 *
 * **Buffer size**: files are hashed in 8192-byte chunks, so uploads of any
 * size are checksummed without loading them whole.
 *
 * **Error Handling**:
 * - File not found or unreadable: throws std::runtime_error
 * - RAND_bytes failure: throws std::runtime_error
 *
 * @date 2025
 */

#include "sandcastle/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/sha.h>
#include <openssl/rand.h>

#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace sandcastle {
namespace utils {

namespace {

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    SHA256_CTX sha256_context;
    SHA256_Init(&sha256_context);

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        SHA256_Update(&sha256_context, buffer, static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256_context);

    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::RandomHex(std::size_t byte_count) {
    std::vector<unsigned char> bytes(byte_count);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        spdlog::error("RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return BinaryToHex(bytes.data(), bytes.size());
}

std::string HashUtils::GenerateId(const std::string& prefix, std::size_t byte_count) {
    return prefix + "-" + RandomHex(byte_count);
}

} // namespace utils
} // namespace sandcastle
