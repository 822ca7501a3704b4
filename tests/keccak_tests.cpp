#include "utilities/hex_utils.hpp"
#include "utilities/keccak.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using merkledrop::utils::DigestArray;
using merkledrop::utils::Keccak256;
using merkledrop::utils::digest_to_hex;

namespace {

DigestArray hashString(const std::string &s) {
  return Keccak256::hash(reinterpret_cast<const uint8_t *>(s.data()),
                         s.size());
}

} // namespace

TEST(Keccak256Test, KnownVectors) {
  // Original Keccak padding; SHA3-256("") would be a7ffc6f8...
  EXPECT_EQ(digest_to_hex(hashString("")),
            "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  EXPECT_EQ(digest_to_hex(hashString("abc")),
            "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");

  DigestArray zero{};
  Keccak256 hasher;
  hasher.ingest(zero);
  hasher.ingest(zero);
  EXPECT_EQ(digest_to_hex(hasher.finalize()),
            "ad3228b676f7d3cd4284a5443f17f1962b36e491b30a40b2405849e597ba5fb5");
}

TEST(Keccak256Test, IncrementalMatchesOneShot) {
  const std::string data = "The quick brown fox jumps over the lazy dog";
  Keccak256 hasher;
  hasher.ingest(reinterpret_cast<const uint8_t *>(data.data()), 10);
  hasher.ingest(nullptr, 0); // no-op
  hasher.ingest(reinterpret_cast<const uint8_t *>(data.data()) + 10,
                data.size() - 10);
  EXPECT_EQ(hasher.finalize(), hashString(data));
}

TEST(Keccak256Test, SingleUse) {
  Keccak256 hasher;
  const uint8_t byte = 0x42;
  hasher.ingest(&byte, 1);
  hasher.finalize();
  EXPECT_THROW(hasher.finalize(), std::logic_error);
  EXPECT_THROW(hasher.ingest(&byte, 1), std::logic_error);
}
