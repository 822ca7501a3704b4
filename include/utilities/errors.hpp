#ifndef MERKLEDROP_ERRORS_HPP
#define MERKLEDROP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace merkledrop {

/**
 * @brief Raised when caller supplied data cannot be decoded.
 *
 * Covers malformed identities, hex digests, snapshots, campaign documents
 * and content identifiers. A proof that simply does not match its root is
 * not an error and never raises this.
 */
class InvalidInputError : public std::runtime_error {
public:
  explicit InvalidInputError(const std::string &what)
      : std::runtime_error(what) {}
};

/// Raised by MerkleTree::build() when handed zero leaves.
class EmptyTreeError : public std::logic_error {
public:
  EmptyTreeError()
      : std::logic_error("Cannot build a merkle tree from zero leaves") {}
};

} // namespace merkledrop

#endif // MERKLEDROP_ERRORS_HPP
