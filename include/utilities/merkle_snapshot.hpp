#ifndef MERKLEDROP_MERKLE_SNAPSHOT_HPP
#define MERKLEDROP_MERKLE_SNAPSHOT_HPP

#include "utilities/merkle_tree.hpp"
#include <string>

namespace merkledrop {

/**
 * @brief JSON form of a MerkleTree suitable for publication.
 *
 * Layout: {"root":"<hex>","tree":[["<hex>",...],...]} with level 0 first.
 * load(dump(t)) == t and dump() is byte-stable for a given tree.
 */
class MerkleSnapshot {
public:
  static std::string dump(const MerkleTree &tree);

  /**
   * @brief Parse a snapshot produced by dump().
   * @throws InvalidInputError if the text is not JSON, misses "root" or
   *         "tree", holds a malformed digest, has an inconsistent level
   *         shape, or if "root" differs from the top node.
   */
  static MerkleTree load(const std::string &text);
};

} // namespace merkledrop

#endif // MERKLEDROP_MERKLE_SNAPSHOT_HPP
