#ifndef MERKLEDROP_BASE58_HPP
#define MERKLEDROP_BASE58_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace merkledrop::utils {

/**
 * @brief Decode a base-58 string (Bitcoin/Solana alphabet).
 *
 * Leading '1' characters map to leading zero bytes.
 * @throws merkledrop::InvalidInputError on characters outside the alphabet.
 */
std::vector<uint8_t> decode_base58(const std::string &text);

/// Encode bytes with the base-58 alphabet.
std::string encode_base58(const std::vector<uint8_t> &bytes);

} // namespace merkledrop::utils

#endif // MERKLEDROP_BASE58_HPP
