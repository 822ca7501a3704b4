#ifndef MERKLEDROP_MERKLE_LEAF_HPP
#define MERKLEDROP_MERKLE_LEAF_HPP

#include "utilities/digest.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace merkledrop {

/// Raw recipient identity size (an ed25519 public key).
inline constexpr size_t IDENTITY_SIZE = 32;

/// index (4) + identity (32) + amount (8).
inline constexpr size_t LEAF_ENCODED_SIZE = 4 + IDENTITY_SIZE + 8;

using Identity = std::array<uint8_t, IDENTITY_SIZE>;

/**
 * @brief One recipient entry committed into the tree.
 *
 * The commitment is Keccak256(Keccak256(encode())). Hashing twice keeps leaf
 * commitments out of the domain of 64 byte internal node preimages.
 */
struct MerkleLeaf {
  uint32_t index{0};   ///< Position in the recipient list
  Identity recipient{}; ///< Decoded recipient public key
  uint64_t amount{0};  ///< Amount in base units

  /**
   * @brief Build a leaf from a base-58 encoded address.
   * @throws InvalidInputError if @p address is not base-58 or does not decode
   *         to exactly IDENTITY_SIZE bytes.
   */
  static MerkleLeaf fromAddress(uint32_t index, const std::string &address,
                                uint64_t amount);

  /// Decode a base-58 address into a raw identity.
  static Identity parseIdentity(const std::string &address);

  /// index LE || recipient || amount LE
  std::array<uint8_t, LEAF_ENCODED_SIZE> encode() const;

  utils::DigestArray commit() const;

  bool operator==(const MerkleLeaf &) const = default;
};

} // namespace merkledrop

#endif // MERKLEDROP_MERKLE_LEAF_HPP
