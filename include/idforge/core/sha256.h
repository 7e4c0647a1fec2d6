#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace idforge::core {

using Sha256Digest = std::array<std::uint8_t, 32>;

// sha256_digest returns the FIPS 180-4 SHA-256 digest of input as 32 raw bytes,
// most significant byte of the first state word first.
[[nodiscard]] Sha256Digest sha256_digest(std::string_view input);

// sha256_hex returns the same digest as a 64-character lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace idforge::core
