#ifndef MERKLEDROP_CID_UTILS_HPP
#define MERKLEDROP_CID_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "digest.hpp"

namespace merkledrop::utils {

extern const std::vector<uint8_t> CID_PREFIX_SHA256;

/**
 * @brief Converts a SHA-256 digest to a CIDv1 string.
 * @param digest The hash digest.
 * @return The CIDv1 string (RFC 4648 base-32).
 */
std::string digest_to_cid(const DigestArray &digest);

/**
 * @brief Converts a CIDv1 string to its digest.
 * @param cid The CIDv1 string.
 * @return The extracted digest.
 * @throws merkledrop::InvalidInputError if the CID is invalid.
 */
DigestArray cid_to_digest(const std::string &cid);

/**
 * @brief Content address of a document: CIDv1 over its SHA-256 digest.
 */
std::string compute_cid(const std::string &content);

/// SHA-256 of @p content (libsodium).
DigestArray sha256(const std::string &content);

} // namespace merkledrop::utils

#endif // MERKLEDROP_CID_UTILS_HPP
