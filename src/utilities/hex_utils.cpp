#include "utilities/hex_utils.hpp"
#include "utilities/errors.hpp"
#include <sodium.h>

namespace merkledrop::utils {

std::string digest_to_hex(const DigestArray &digest) {
  char buf[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(buf, sizeof(buf), digest.data(), digest.size());
  return std::string(buf, DIGEST_SIZE * 2);
}

DigestArray hex_to_digest(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw InvalidInputError("Invalid digest: expected " +
                            std::to_string(DIGEST_SIZE * 2) +
                            " hex characters, got " +
                            std::to_string(hex.size()));
  }
  DigestArray digest{};
  size_t bin_len = 0;
  const char *hex_end = nullptr;
  // sodium_hex2bin stops at the first non-hex character; hex_end tells us
  // whether the whole string was consumed.
  if (sodium_hex2bin(digest.data(), digest.size(), hex.data(), hex.size(),
                     nullptr, &bin_len, &hex_end) != 0 ||
      bin_len != DIGEST_SIZE || hex_end != hex.data() + hex.size()) {
    throw InvalidInputError("Invalid digest: '" + hex +
                            "' is not a hexadecimal string");
  }
  return digest;
}

std::string bytes_to_hex(const std::vector<uint8_t> &bytes) {
  std::string out(bytes.size() * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
  out.resize(bytes.size() * 2);
  return out;
}

} // namespace merkledrop::utils
