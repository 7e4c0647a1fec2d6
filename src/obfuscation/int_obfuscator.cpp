#include "idforge/obfuscation/int_obfuscator.h"

namespace idforge::obfuscation {

std::int64_t IntObfuscator::obfuscate(const std::int64_t id) const noexcept {
  const auto masked = static_cast<std::uint64_t>(id) ^ static_cast<std::uint64_t>(key_);
  return static_cast<std::int64_t>(permute_bits(masked, kPermutation));
}

std::int64_t IntObfuscator::deobfuscate(const std::int64_t code) const noexcept {
  const std::uint64_t unpermuted = inverse_permute_bits(static_cast<std::uint64_t>(code));
  return static_cast<std::int64_t>(unpermuted ^ static_cast<std::uint64_t>(key_));
}

std::int64_t recover_key(const std::int64_t plaintext, const std::int64_t ciphertext) noexcept {
  const std::uint64_t unpermuted = inverse_permute_bits(static_cast<std::uint64_t>(ciphertext));
  return static_cast<std::int64_t>(unpermuted ^ static_cast<std::uint64_t>(plaintext));
}

}  // namespace idforge::obfuscation
