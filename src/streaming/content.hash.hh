#pragma once

#include "definitions.hh"

#include <functional>
#include <string>

namespace stow {
/**
 * @brief Computes a stable digest string for a buffer. Used to verify
 * uploads and to compare resumed parts against stored ones.
 */
using ContentHasher = std::function<std::string(ConstByteSpan)>;

/**
 * @brief Compute the MD5 digest of @p data as lowercase hex.
 * @details This is the ETag S3 reports for a part uploaded without
 * server-side encryption.
 * @param data The data to hash.
 * @return The hex digest.
 * @throws std::runtime_error if the digest cannot be computed.
 */
std::string
md5_hex(ConstByteSpan data);
} // namespace stow
