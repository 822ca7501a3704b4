#include "utilities/merkle_tree.hpp"
#include "utilities/errors.hpp"
#include "utilities/hex_utils.hpp"
#include "utilities/keccak.hpp"
#include <algorithm>
#include <bit>

namespace merkledrop {

MerkleTree::Hash MerkleTree::hashPair(const Hash &a, const Hash &b) {
  // std::array compares lexicographically, i.e. as big-endian integers.
  const Hash &lo = (a <= b) ? a : b;
  const Hash &hi = (a <= b) ? b : a;
  utils::Keccak256 hasher;
  hasher.ingest(lo);
  hasher.ingest(hi);
  return hasher.finalize();
}

MerkleTree::Hash MerkleTree::hashSelf(const Hash &node) {
  utils::Keccak256 hasher;
  hasher.ingest(node);
  hasher.ingest(node);
  return hasher.finalize();
}

MerkleTree MerkleTree::build(const std::vector<MerkleLeaf> &leaves) {
  if (leaves.empty()) {
    throw EmptyTreeError();
  }

  Level current;
  current.reserve(leaves.size());
  for (const auto &leaf : leaves) {
    current.push_back(leaf.commit());
  }

  std::vector<Level> levels;
  levels.push_back(std::move(current));
  while (levels.back().size() > 1) {
    const Level &below = levels.back();
    Level next;
    next.reserve((below.size() + 1) / 2);
    for (size_t i = 0; i < below.size(); i += 2) {
      if (i + 1 < below.size()) {
        next.push_back(hashPair(below[i], below[i + 1]));
      } else {
        next.push_back(hashSelf(below[i]));
      }
    }
    levels.push_back(std::move(next));
  }
  return MerkleTree(std::move(levels));
}

MerkleTree MerkleTree::fromLevels(std::vector<Level> levels) {
  if (levels.empty() || levels.front().empty()) {
    throw InvalidInputError("Merkle tree must contain at least one leaf");
  }
  for (size_t i = 1; i < levels.size(); ++i) {
    size_t expected = (levels[i - 1].size() + 1) / 2;
    if (levels[i].size() != expected || levels[i - 1].size() == 1) {
      throw InvalidInputError("Merkle tree level " + std::to_string(i) +
                              " has " + std::to_string(levels[i].size()) +
                              " nodes, expected " + std::to_string(expected));
    }
  }
  if (levels.back().size() != 1) {
    throw InvalidInputError("Merkle tree top level must hold exactly one node");
  }
  return MerkleTree(std::move(levels));
}

std::string MerkleTree::rootHex() const { return utils::digest_to_hex(root()); }

std::optional<MerkleTree::Proof> MerkleTree::getProof(size_t index) const {
  if (index >= leafCount()) {
    return std::nullopt;
  }
  Proof proof;
  size_t current = index;
  for (size_t level = 0; level + 1 < levels_.size(); ++level) {
    size_t sibling = current ^ 1;
    if (sibling < levels_[level].size()) {
      proof.push_back(levels_[level][sibling]);
    }
    current /= 2;
  }
  return proof;
}

std::optional<std::vector<std::string>>
MerkleTree::getProofHex(size_t index) const {
  auto proof = getProof(index);
  if (!proof) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  out.reserve(proof->size());
  for (const auto &h : *proof) {
    out.push_back(utils::digest_to_hex(h));
  }
  return out;
}

MerkleTree::Hash MerkleTree::foldProof(const Hash &leafHash,
                                       const Proof &proof) {
  Hash computed = leafHash;
  for (const auto &sibling : proof) {
    computed = hashPair(computed, sibling);
  }
  return computed;
}

// Replays the path of the node at leaf position `index` assuming it is the
// last node of its level from level `lastFrom` upward. Below that level every
// step has a real sibling; from it on, odd positions pair with their left
// neighbour and even positions are self-paired, until position 0 is the root.
std::optional<MerkleTree::Hash>
MerkleTree::replayPath(Hash computed, size_t index, const Proof &proof,
                       size_t lastFrom) {
  size_t used = 0;
  size_t node = index;
  for (size_t level = 0;; ++level) {
    if (level >= lastFrom) {
      if (node == 0) {
        break;
      }
      if (node & 1) {
        if (used == proof.size()) {
          return std::nullopt;
        }
        computed = hashPair(computed, proof[used++]);
      } else {
        computed = hashSelf(computed);
      }
    } else {
      if (used == proof.size()) {
        return std::nullopt;
      }
      computed = hashPair(computed, proof[used++]);
    }
    node >>= 1;
  }
  if (used != proof.size()) {
    return std::nullopt;
  }
  return computed;
}

bool MerkleTree::verifyProof(const MerkleLeaf &leaf, const Hash &root,
                             const Proof &proof) {
  if (proof.size() > MAX_PROOF_LENGTH) {
    return false;
  }
  const Hash leafHash = leaf.commit();
  if (foldProof(leafHash, proof) == root) {
    return true;
  }
  // From bit_width(index) upward the node is already 0, so a replay there
  // either equals the plain fold or leaves entries unused.
  const size_t lastLimit = std::min<size_t>(
      proof.size(), static_cast<size_t>(std::bit_width(leaf.index)));
  for (size_t lastFrom = 0; lastFrom <= lastLimit; ++lastFrom) {
    auto computed = replayPath(leafHash, leaf.index, proof, lastFrom);
    if (computed && *computed == root) {
      return true;
    }
  }
  return false;
}

bool MerkleTree::verifyProof(const MerkleLeaf &leaf, const std::string &rootHex,
                             const std::vector<std::string> &proof) {
  Hash root = utils::hex_to_digest(rootHex);
  Proof decoded;
  decoded.reserve(proof.size());
  for (const auto &entry : proof) {
    decoded.push_back(utils::hex_to_digest(entry));
  }
  return verifyProof(leaf, root, decoded);
}

} // namespace merkledrop
