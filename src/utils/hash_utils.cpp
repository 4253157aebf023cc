/**
 * @file hash_utils.cpp
 * @brief SHA-256 digests via OpenSSL
 *
 * @date 2025
 */

#include "crucible/utils/hash_utils.hpp"
#include "crucible/utils/string_utils.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace crucible {
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

std::string HashUtils::ComputeCodeFingerprint(const std::string& code) {
    std::string normalized;
    normalized.reserve(code.size());
    for (const auto& line : StringUtils::SplitLines(code)) {
        std::string stripped = line;
        while (!stripped.empty() && (stripped.back() == ' ' || stripped.back() == '\t')) {
            stripped.pop_back();
        }
        normalized += stripped;
        normalized += '\n';
    }
    while (normalized.size() >= 2 && normalized[normalized.size() - 1] == '\n' &&
           normalized[normalized.size() - 2] == '\n') {
        normalized.pop_back();
    }
    return ComputeSHA256(normalized);
}

std::string HashUtils::ShortDigest(const std::string& digest) {
    return digest.substr(0, 12);
}

} // namespace utils
} // namespace crucible
