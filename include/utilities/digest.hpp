#ifndef MERKLEDROP_DIGEST_HPP
#define MERKLEDROP_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace merkledrop::utils {

/// Digest size shared by Keccak-256 and SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

} // namespace merkledrop::utils

#endif // MERKLEDROP_DIGEST_HPP
