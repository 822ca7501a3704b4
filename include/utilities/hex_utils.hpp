#ifndef MERKLEDROP_HEX_UTILS_HPP
#define MERKLEDROP_HEX_UTILS_HPP

#include "utilities/digest.hpp"
#include <string>
#include <vector>

namespace merkledrop::utils {

/**
 * @brief Render a digest as 64 lowercase hexadecimal characters.
 */
std::string digest_to_hex(const DigestArray &digest);

/**
 * @brief Parse a 64 character hexadecimal digest.
 *
 * Upper and lower case digits are accepted.
 * @throws merkledrop::InvalidInputError if @p hex is not exactly 64 hex digits.
 */
DigestArray hex_to_digest(const std::string &hex);

/// Lowercase hex for an arbitrary byte buffer.
std::string bytes_to_hex(const std::vector<uint8_t> &bytes);

} // namespace merkledrop::utils

#endif // MERKLEDROP_HEX_UTILS_HPP
