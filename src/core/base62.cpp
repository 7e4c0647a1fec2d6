#include "idforge/core/base62.h"

#include <algorithm>
#include <limits>

namespace idforge::core {

namespace {

constexpr std::int64_t kBase = static_cast<std::int64_t>(kBase62Alphabet.size());

int digit_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'z') {
    return 10 + (ch - 'a');
  }
  if (ch >= 'A' && ch <= 'Z') {
    return 36 + (ch - 'A');
  }
  return -1;
}

}  // namespace

std::string encode_base62(std::int64_t value) {
  std::string out;
  while (value > 0) {
    out.push_back(kBase62Alphabet[static_cast<std::size_t>(value % kBase)]);
    value /= kBase;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<std::int64_t> decode_base62(const std::string_view text) {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

  std::int64_t value = 0;
  for (const char ch : text) {
    const int digit = digit_value(ch);
    if (digit < 0) {
      return std::nullopt;
    }
    if (value > (kMax - digit) / kBase) {
      return std::nullopt;
    }
    value = value * kBase + digit;
  }
  return value;
}

}  // namespace idforge::core
