#include "idforge/obfuscation/int_obfuscator.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <random>
#include <set>

using idforge::obfuscation::IntObfuscator;
using idforge::obfuscation::kInversePermutation;
using idforge::obfuscation::kPermutation;

namespace {

constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

}  // namespace

TEST_CASE("kPermutation is a bijection that keeps each half in place", "[obfuscation]") {
  std::set<unsigned> targets;
  for (unsigned i = 0; i < 64; ++i) {
    targets.insert(kPermutation[i]);
    CHECK((kPermutation[i] < 32) == (i < 32));
    CHECK(kInversePermutation[kPermutation[i]] == i);
  }
  CHECK(targets.size() == 64);
}

TEST_CASE("permute_bits moves input bit i to output bit kPermutation[i]", "[obfuscation]") {
  using idforge::obfuscation::permute_bits;
  CHECK(permute_bits(std::uint64_t{1}, kPermutation) == std::uint64_t{1} << kPermutation[0]);
  CHECK(permute_bits(std::uint64_t{1} << 63, kPermutation) ==
        std::uint64_t{1} << kPermutation[63]);
  CHECK(permute_bits(0, kPermutation) == 0);
  CHECK(permute_bits(~std::uint64_t{0}, kPermutation) == ~std::uint64_t{0});
}

TEST_CASE("IntObfuscator with the default key matches known values", "[obfuscation]") {
  const IntObfuscator obfuscator(0);
  CHECK(obfuscator.key() == IntObfuscator::kDefaultKey);
  CHECK(obfuscator.obfuscate(0) == 7273261929008452400);
  CHECK(obfuscator.obfuscate(1) == 7273261929008452528);
  CHECK(obfuscator.obfuscate(12345) == 7273261927952536208);
  CHECK(obfuscator.deobfuscate(7273261929008452528) == 1);
}

TEST_CASE("A zero key behaves exactly like the default key", "[obfuscation]") {
  const IntObfuscator zero(0);
  const IntObfuscator explicit_default(IntObfuscator::kDefaultKey);
  for (const std::int64_t id : {std::int64_t{0}, std::int64_t{42}, kMin, kMax}) {
    CHECK(zero.obfuscate(id) == explicit_default.obfuscate(id));
  }
}

TEST_CASE("deobfuscate inverts obfuscate for every key and value", "[obfuscation]") {
  std::mt19937_64 rng(20160521);

  for (const std::int64_t key : {std::int64_t{0}, std::int64_t{1}, std::int64_t{-1}, kMin,
                                 static_cast<std::int64_t>(rng())}) {
    const IntObfuscator obfuscator(key);

    for (const std::int64_t id : {std::int64_t{0}, std::int64_t{1}, std::int64_t{-1}, kMin, kMax}) {
      CHECK(obfuscator.deobfuscate(obfuscator.obfuscate(id)) == id);
    }
    for (int i = 0; i < 1000; ++i) {
      const auto id = static_cast<std::int64_t>(rng());
      CHECK(obfuscator.deobfuscate(obfuscator.obfuscate(id)) == id);
    }
  }
}

TEST_CASE("Different keys produce different codes", "[obfuscation]") {
  const IntObfuscator a(12345);
  const IntObfuscator b(12346);
  CHECK(a.obfuscate(1) != b.obfuscate(1));
  CHECK(a.obfuscate(1) == 1091567904);
}

TEST_CASE("One known pair discloses the key", "[obfuscation][weakness]") {
  const IntObfuscator secret(0x1234'5678'9abc'def0);
  const std::int64_t plaintext = 1001;
  const std::int64_t ciphertext = secret.obfuscate(plaintext);

  const std::int64_t recovered = idforge::obfuscation::recover_key(plaintext, ciphertext);
  CHECK(recovered == secret.key());

  const IntObfuscator attacker(recovered);
  CHECK(attacker.deobfuscate(secret.obfuscate(999'999)) == 999'999);
}
