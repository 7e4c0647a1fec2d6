#include "idforge/core/base62.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>

using idforge::core::decode_base62;
using idforge::core::encode_base62;

TEST_CASE("encode_base62 uses digits, then lower case, then upper case", "[base62]") {
  CHECK(encode_base62(1) == "1");
  CHECK(encode_base62(10) == "a");
  CHECK(encode_base62(36) == "A");
  CHECK(encode_base62(61) == "Z");
  CHECK(encode_base62(62) == "10");
  CHECK(encode_base62(62 * 62) == "100");
}

TEST_CASE("encode_base62 renders zero and negatives as empty", "[base62]") {
  CHECK(encode_base62(0).empty());
  CHECK(encode_base62(-1).empty());
  CHECK(encode_base62(std::numeric_limits<std::int64_t>::min()).empty());
}

TEST_CASE("decode_base62 inverts encode_base62", "[base62]") {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

  CHECK(decode_base62("").value() == 0);
  CHECK(decode_base62("Z").value() == 61);
  CHECK(decode_base62("10").value() == 62);
  CHECK(decode_base62(encode_base62(kMax)).value() == kMax);
  CHECK(decode_base62(encode_base62(123456789012345)).value() == 123456789012345);
}

TEST_CASE("decode_base62 rejects foreign characters and overflow", "[base62]") {
  CHECK_FALSE(decode_base62("12-3").has_value());
  CHECK_FALSE(decode_base62(" 1").has_value());
  // 62^11 - 1 exceeds INT64_MAX.
  CHECK_FALSE(decode_base62("ZZZZZZZZZZZ").has_value());
}
