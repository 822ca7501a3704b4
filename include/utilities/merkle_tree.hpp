#ifndef MERKLEDROP_MERKLE_TREE_HPP
#define MERKLEDROP_MERKLE_TREE_HPP

#include "utilities/digest.hpp"
#include "utilities/merkle_leaf.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace merkledrop {

/**
 * @brief Binary Keccak-256 Merkle tree over an ordered recipient list.
 *
 * levels()[0] holds the leaf commitments in input order, every following
 * level holds the parents of the one below and the last level holds only the
 * root. Sibling pairs are hashed smaller-first so that proofs carry no
 * left/right flags; a trailing node without a sibling is hashed with itself.
 *
 * A tree is immutable once built.
 */
class MerkleTree {
public:
  using Hash = utils::DigestArray;
  using Level = std::vector<Hash>;
  using Proof = std::vector<Hash>;

  /// Longest proof a 32-bit leaf index can have (2^32 leaves, 33 levels).
  static constexpr size_t MAX_PROOF_LENGTH = 32;

  /**
   * @brief Build the tree for @p leaves (order defines topology).
   * @throws EmptyTreeError if @p leaves is empty.
   */
  static MerkleTree build(const std::vector<MerkleLeaf> &leaves);

  /**
   * @brief Rebuild a tree object from previously computed levels.
   *
   * Only the shape is validated: at least one level, each level
   * ceil(previous / 2) entries long, a single node on top.
   * @throws InvalidInputError if the shape is inconsistent.
   */
  static MerkleTree fromLevels(std::vector<Level> levels);

  /// Keccak256(min(a, b) || max(a, b)), bytes compared big-endian.
  static Hash hashPair(const Hash &a, const Hash &b);

  /// Keccak256(node || node), parent of a trailing unpaired node.
  static Hash hashSelf(const Hash &node);

  const Hash &root() const { return levels_.back().front(); }
  std::string rootHex() const;

  const std::vector<Level> &levels() const { return levels_; }
  size_t leafCount() const { return levels_.front().size(); }
  size_t height() const { return levels_.size(); }

  /**
   * @brief Sibling path for the leaf at @p index, leaf side first.
   *
   * Levels on which the node is the self-paired trailing node contribute no
   * entry, so proofs in one tree can differ in length.
   * @return std::nullopt when @p index is out of range.
   */
  std::optional<Proof> getProof(size_t index) const;

  /// getProof() rendered as lowercase hex strings.
  std::optional<std::vector<std::string>> getProofHex(size_t index) const;

  /**
   * @brief Check that @p proof links @p leaf to @p root.
   *
   * The canonical fold (hashPair with every entry in order) is tried first.
   * If it misses, the levels on which the leaf's node may have been the
   * trailing node are replayed from the leaf index, applying hashSelf() where
   * getProof() emitted nothing.
   * @return false on mismatch or for proofs longer than MAX_PROOF_LENGTH;
   *         never throws for a well-formed proof.
   */
  static bool verifyProof(const MerkleLeaf &leaf, const Hash &root,
                          const Proof &proof);

  /**
   * @brief Hex overload of verifyProof().
   * @throws InvalidInputError if the root or any entry is not a 64 character
   *         hex digest.
   */
  static bool verifyProof(const MerkleLeaf &leaf, const std::string &rootHex,
                          const std::vector<std::string> &proof);

  /// Fold @p proof into @p leafHash with hashPair(), nothing else.
  static Hash foldProof(const Hash &leafHash, const Proof &proof);

  bool operator==(const MerkleTree &) const = default;

private:
  explicit MerkleTree(std::vector<Level> levels) : levels_(std::move(levels)) {}

  static std::optional<Hash> replayPath(Hash computed, size_t index,
                                        const Proof &proof, size_t lastFrom);

  std::vector<Level> levels_;
};

} // namespace merkledrop

#endif // MERKLEDROP_MERKLE_TREE_HPP
