#include "utilities/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp"
#include "utilities/errors.hpp"
#include <algorithm>
#include <sodium.h>
#include <stdexcept>

namespace merkledrop::utils {

// CIDv1 (0x01)
// multicodec for DAG-PB (0x70)
// multicodec for SHA2-256 (0x12)
// length of hash (0x20)
const std::vector<uint8_t> CID_PREFIX_SHA256 = {0x01, 0x70, 0x12, 0x20};

std::string digest_to_cid(const DigestArray &digest) {
  std::vector<uint8_t> bytes_to_encode;
  bytes_to_encode.insert(bytes_to_encode.end(), CID_PREFIX_SHA256.begin(),
                         CID_PREFIX_SHA256.end());
  bytes_to_encode.insert(bytes_to_encode.end(), digest.begin(), digest.end());

  return cppcodec::base32_rfc4648::encode(bytes_to_encode);
}

DigestArray cid_to_digest(const std::string &cid) {
  if (cid.empty()) {
    throw InvalidInputError("CID string cannot be empty.");
  }

  std::vector<uint8_t> decoded_bytes;
  try {
    decoded_bytes = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const std::exception &e) {
    throw InvalidInputError("Failed to decode Base32 CID: " +
                            std::string(e.what()));
  }

  if (decoded_bytes.size() < CID_PREFIX_SHA256.size()) {
    throw InvalidInputError(
        "Invalid CID: Decoded data too short to contain prefix.");
  }
  if (!std::equal(CID_PREFIX_SHA256.begin(), CID_PREFIX_SHA256.end(),
                  decoded_bytes.begin())) {
    throw InvalidInputError("Invalid CID: Prefix mismatch.");
  }
  if (decoded_bytes.size() != CID_PREFIX_SHA256.size() + DIGEST_SIZE) {
    throw InvalidInputError("Invalid CID: Decoded data length does not match "
                            "expected digest size.");
  }

  DigestArray digest;
  std::copy(decoded_bytes.begin() + CID_PREFIX_SHA256.size(),
            decoded_bytes.end(), digest.begin());
  return digest;
}

DigestArray sha256(const std::string &content) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  DigestArray digest{};
  crypto_hash_sha256(digest.data(),
                     reinterpret_cast<const unsigned char *>(content.data()),
                     content.size());
  return digest;
}

std::string compute_cid(const std::string &content) {
  return digest_to_cid(sha256(content));
}

} // namespace merkledrop::utils
