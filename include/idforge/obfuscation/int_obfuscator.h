#pragma once

#include <array>
#include <cstdint>

namespace idforge::obfuscation {

// IntObfuscator masks sequential integer ids before they leave the service.
//
// NOT ENCRYPTION. The permutation below is a public constant and XOR is
// linear, so one known (plaintext, ciphertext) pair discloses the key:
//   key = inverse_permute_bits(ciphertext) ^ plaintext
// (see recover_key). Use it to deter enumeration of ids, never to protect
// confidential values.

using BitPermutation = std::array<std::uint8_t, 64>;

// Input bit i moves to output bit kPermutation[i]. Each half of the word is
// permuted within itself. Fixed for all instances and all time; changing it
// breaks every value already handed out.
inline constexpr BitPermutation kPermutation = {
    7,  22, 13, 8,  30, 24, 17, 2,  28, 19, 11, 29, 5,  20, 15, 31,
    0,  12, 25, 21, 4,  10, 16, 1,  27, 23, 6,  14, 9,  3,  26, 18,
    45, 58, 41, 50, 62, 56, 49, 34, 60, 51, 43, 61, 37, 52, 47, 63,
    32, 44, 57, 53, 36, 42, 48, 33, 59, 55, 38, 46, 40, 35, 54, 39,
};

[[nodiscard]] constexpr BitPermutation invert_permutation(const BitPermutation& perm) noexcept {
  BitPermutation inverse{};
  for (std::uint8_t i = 0; i < 64; ++i) {
    inverse[perm[i]] = i;
  }
  return inverse;
}

inline constexpr BitPermutation kInversePermutation = invert_permutation(kPermutation);

[[nodiscard]] constexpr std::uint64_t permute_bits(const std::uint64_t value,
                                                   const BitPermutation& perm) noexcept {
  std::uint64_t result = 0;
  for (unsigned i = 0; i < 64; ++i) {
    result |= ((value >> i) & 1u) << perm[i];
  }
  return result;
}

[[nodiscard]] constexpr std::uint64_t inverse_permute_bits(const std::uint64_t value) noexcept {
  return permute_bits(value, kInversePermutation);
}

class IntObfuscator {
 public:
  // Substituted for a zero key. Documented, not secret.
  static constexpr std::int64_t kDefaultKey = 0x5a5a5a5a5a5a5a5a;

  // Any key is accepted; 0 selects kDefaultKey.
  explicit constexpr IntObfuscator(std::int64_t key) noexcept
      : key_(key == 0 ? kDefaultKey : key) {}

  // XOR with the key, then permute bits.
  [[nodiscard]] std::int64_t obfuscate(std::int64_t id) const noexcept;

  // Inverse permutation, then XOR with the key.
  // deobfuscate(obfuscate(x)) == x for every int64 x.
  [[nodiscard]] std::int64_t deobfuscate(std::int64_t code) const noexcept;

  [[nodiscard]] constexpr std::int64_t key() const noexcept { return key_; }

 private:
  std::int64_t key_;
};

// recover_key returns the key that maps plaintext to ciphertext.
// Exists to document and test the known-plaintext weakness.
[[nodiscard]] std::int64_t recover_key(std::int64_t plaintext, std::int64_t ciphertext) noexcept;

static_assert(permute_bits(inverse_permute_bits(0x0123456789abcdefull), kPermutation) ==
              0x0123456789abcdefull);

}  // namespace idforge::obfuscation
