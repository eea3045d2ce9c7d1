/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 digest helpers
 *
 * Uses the OpenSSL EVP interface. File hashing is streamed so large inputs
 * never have to be loaded into memory.
 *
 * @date 2025
 */

#include "warden/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace warden {
namespace utils {

namespace {

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSHA256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    return ctx;
}

std::string FinalizeHex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash.data(), &length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return BinaryToHex(hash.data(), length);
}

} // anonymous namespace

// ============================================================================
// SHA-256
// ============================================================================

std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto ctx = NewSHA256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
    return FinalizeHex(ctx.get());
}

std::string HashUtils::ComputeFileSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        spdlog::error("Cannot open file for hashing: {}", file_path.string());
        throw std::runtime_error("Cannot open file: " + file_path.string());
    }

    auto ctx = NewSHA256Context();
    std::array<char, 8192> buffer{};
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(),
                             static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }
    return FinalizeHex(ctx.get());
}

// ============================================================================
// COMPARISON
// ============================================================================

bool HashUtils::ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(
            std::tolower(static_cast<unsigned char>(a[i])) ^
            std::tolower(static_cast<unsigned char>(b[i])));
    }
    return diff == 0;
}

bool HashUtils::IsSHA256Hex(const std::string& value) {
    if (value.size() != 64) {
        return false;
    }
    for (unsigned char c : value) {
        if (!std::isxdigit(c)) {
            return false;
        }
    }
    return true;
}

} // namespace utils
} // namespace warden
