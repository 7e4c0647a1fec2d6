#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace idforge::core {

// Alphabet order is part of the wire format: digits, lower case, upper case.
inline constexpr std::string_view kBase62Alphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

// encode_base62 renders value most significant digit first.
// Zero and negative values encode to the empty string.
[[nodiscard]] std::string encode_base62(std::int64_t value);

// decode_base62 is the inverse of encode_base62 for non-negative values.
// Returns nullopt for characters outside the alphabet or values above INT64_MAX.
// The empty string decodes to 0.
[[nodiscard]] std::optional<std::int64_t> decode_base62(std::string_view text);

}  // namespace idforge::core
