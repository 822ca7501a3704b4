#ifndef MERKLEDROP_KECCAK_HPP
#define MERKLEDROP_KECCAK_HPP

#include "utilities/digest.hpp"
#include <cryptopp/keccak.h>
#include <cstddef>
#include <cstdint>

namespace merkledrop::utils {

/**
 * @brief Incremental Keccak-256 hasher (original Keccak padding, not SHA3).
 *
 * Feed data with ingest() and obtain the digest with finalize(). A hasher is
 * single use: ingesting or finalizing after finalize() throws
 * std::logic_error.
 */
class Keccak256 {
public:
  void ingest(const uint8_t *data, size_t size);

  template <size_t N> void ingest(const std::array<uint8_t, N> &bytes) {
    ingest(bytes.data(), bytes.size());
  }

  DigestArray finalize();

  /// One-shot digest of a contiguous buffer.
  static DigestArray hash(const uint8_t *data, size_t size);

private:
  CryptoPP::Keccak_256 state_;
  bool finalized_ = false;
};

} // namespace merkledrop::utils

#endif // MERKLEDROP_KECCAK_HPP
