#include "utilities/keccak.hpp"
#include <stdexcept>

namespace merkledrop::utils {

void Keccak256::ingest(const uint8_t *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after Keccak256::finalize() has been called.");
  }
  if (data && size > 0) {
    state_.Update(reinterpret_cast<const CryptoPP::byte *>(data), size);
  }
}

DigestArray Keccak256::finalize() {
  if (finalized_) {
    throw std::logic_error("Keccak256::finalize() already called.");
  }
  DigestArray digest{};
  state_.Final(reinterpret_cast<CryptoPP::byte *>(digest.data()));
  finalized_ = true;
  return digest;
}

DigestArray Keccak256::hash(const uint8_t *data, size_t size) {
  Keccak256 hasher;
  hasher.ingest(data, size);
  return hasher.finalize();
}

} // namespace merkledrop::utils
