#pragma once

#include <string>
#include <string_view>

namespace idforge::core {

// normalize_ascii_upper converts ASCII lowercase (a-z) to uppercase (A-Z).
// Every other byte, including non-ASCII, is preserved unchanged, so the
// output always has the same length as the input.
// Locale-independent.
inline std::string normalize_ascii_upper(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'a' && ch <= 'z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

}  // namespace idforge::core
