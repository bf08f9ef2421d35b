#pragma once

/**
 * @file digest.hpp
 * @brief SHA-256 fingerprinting of platform probe output
 */

#include "deviceid/deviceid.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace deviceid {
namespace digest {

/// Encode bytes as lowercase hexadecimal
[[nodiscard]] std::string hex_encode(const std::vector<uint8_t>& data);

/**
 * @brief Compute the SHA-256 digest of a string
 *
 * The input is hashed as raw bytes; no trimming or case folding is applied.
 *
 * @param input Bytes to hash (may be empty)
 * @return 32-byte digest, or Unknown if OpenSSL fails
 */
[[nodiscard]] Result<std::vector<uint8_t>> sha256(const std::string& input);

/**
 * @brief Compute the SHA-256 digest of a string as 64 lowercase hex characters
 */
[[nodiscard]] Result<std::string> sha256_hex(const std::string& input);

}  // namespace digest
}  // namespace deviceid
