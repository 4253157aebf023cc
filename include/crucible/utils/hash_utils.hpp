/**
 * @file hash_utils.hpp
 * @brief SHA-256 fingerprints of generated code and staged files
 *
 * Digests identify identical submissions across repair attempts so the
 * feedback context can point out that the generator repeated itself.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace crucible {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed digests
 *
 * All methods are static and thread-safe.
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a byte string
     * @return 64 lowercase hex characters
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief SHA-256 of the code after normalizing line endings and
     *        trailing whitespace
     *
     * Two generations that differ only in CRLF/LF or trailing blank lines
     * get the same fingerprint.
     */
    static std::string ComputeCodeFingerprint(const std::string& code);

    /**
     * @brief First 12 hex characters, for logs
     */
    static std::string ShortDigest(const std::string& digest);
};

} // namespace utils
} // namespace crucible
