#include "utilities/merkle_leaf.hpp"
#include "utilities/base58.hpp"
#include "utilities/errors.hpp"
#include "utilities/keccak.hpp"
#include <algorithm>

namespace merkledrop {

Identity MerkleLeaf::parseIdentity(const std::string &address) {
  std::vector<uint8_t> decoded = utils::decode_base58(address);
  if (decoded.size() != IDENTITY_SIZE) {
    throw InvalidInputError("Invalid recipient address '" + address +
                            "': decodes to " + std::to_string(decoded.size()) +
                            " bytes, expected " +
                            std::to_string(IDENTITY_SIZE));
  }
  Identity id{};
  std::copy(decoded.begin(), decoded.end(), id.begin());
  return id;
}

MerkleLeaf MerkleLeaf::fromAddress(uint32_t index, const std::string &address,
                                   uint64_t amount) {
  MerkleLeaf leaf;
  leaf.index = index;
  leaf.recipient = parseIdentity(address);
  leaf.amount = amount;
  return leaf;
}

std::array<uint8_t, LEAF_ENCODED_SIZE> MerkleLeaf::encode() const {
  std::array<uint8_t, LEAF_ENCODED_SIZE> out{};
  size_t offset = 0;
  for (size_t i = 0; i < sizeof(index); ++i) {
    out[offset++] = static_cast<uint8_t>(index >> (8 * i));
  }
  std::copy(recipient.begin(), recipient.end(), out.begin() + offset);
  offset += IDENTITY_SIZE;
  for (size_t i = 0; i < sizeof(amount); ++i) {
    out[offset++] = static_cast<uint8_t>(amount >> (8 * i));
  }
  return out;
}

utils::DigestArray MerkleLeaf::commit() const {
  auto encoded = encode();
  utils::DigestArray first = utils::Keccak256::hash(encoded.data(), encoded.size());
  return utils::Keccak256::hash(first.data(), first.size());
}

} // namespace merkledrop
