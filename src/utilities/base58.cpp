#include "utilities/base58.hpp"
#include "utilities/errors.hpp"
#include <algorithm>
#include <array>

namespace merkledrop::utils {

namespace {

constexpr char ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Reverse lookup, -1 for characters outside the alphabet.
const std::array<int8_t, 256> &decodeTable() {
  static const std::array<int8_t, 256> table = [] {
    std::array<int8_t, 256> t{};
    t.fill(-1);
    for (int i = 0; i < 58; ++i) {
      t[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return t;
  }();
  return table;
}

} // namespace

std::vector<uint8_t> decode_base58(const std::string &text) {
  size_t zeroes = 0;
  while (zeroes < text.size() && text[zeroes] == '1') {
    ++zeroes;
  }

  // log(58) / log(256) ~= 0.733, rounded up.
  std::vector<uint8_t> b256((text.size() - zeroes) * 733 / 1000 + 1, 0);
  size_t length = 0;
  for (size_t i = zeroes; i < text.size(); ++i) {
    int carry = decodeTable()[static_cast<unsigned char>(text[i])];
    if (carry < 0) {
      throw InvalidInputError("Invalid base58 character '" +
                              std::string(1, text[i]) + "'");
    }
    size_t j = 0;
    for (auto it = b256.rbegin();
         (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
      carry += 58 * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    length = j;
  }

  auto it = b256.end() - static_cast<std::ptrdiff_t>(length);
  while (it != b256.end() && *it == 0) {
    ++it;
  }
  std::vector<uint8_t> out(zeroes, 0);
  out.insert(out.end(), it, b256.end());
  return out;
}

std::string encode_base58(const std::vector<uint8_t> &bytes) {
  size_t zeroes = 0;
  while (zeroes < bytes.size() && bytes[zeroes] == 0) {
    ++zeroes;
  }

  // log(256) / log(58) ~= 1.366, rounded up.
  std::vector<uint8_t> b58((bytes.size() - zeroes) * 138 / 100 + 1, 0);
  size_t length = 0;
  for (size_t i = zeroes; i < bytes.size(); ++i) {
    int carry = bytes[i];
    size_t j = 0;
    for (auto it = b58.rbegin();
         (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
      carry += 256 * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = b58.end() - static_cast<std::ptrdiff_t>(length);
  while (it != b58.end() && *it == 0) {
    ++it;
  }
  std::string out(zeroes, '1');
  for (; it != b58.end(); ++it) {
    out += ALPHABET[*it];
  }
  return out;
}

} // namespace merkledrop::utils
