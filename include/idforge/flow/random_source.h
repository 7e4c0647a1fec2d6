#pragma once

#include "idforge/core/clock.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace idforge::flow {

// Abstract source of random bytes.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Fill out completely with random bytes.
  // Returns false when the source is unavailable; out is then unspecified.
  virtual bool fill(std::span<std::uint8_t> out) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Kernel CSPRNG via getrandom(2). Thread-safe, stateless.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource() = default;
  ~SystemRandomSource() override = default;

  SystemRandomSource(const SystemRandomSource&) = default;
  SystemRandomSource& operator=(const SystemRandomSource&) = default;
  SystemRandomSource(SystemRandomSource&&) = default;
  SystemRandomSource& operator=(SystemRandomSource&&) = default;

  bool fill(std::span<std::uint8_t> out) override;
};

// system_random returns a process-lifetime SystemRandomSource.
[[nodiscard]] IRandomSource& system_random();

// rejection_limit returns the largest multiple of bound not exceeding UINT32_MAX.
// Draws at or above it are discarded to avoid modulo bias.
[[nodiscard]] constexpr std::uint32_t rejection_limit(std::uint32_t bound) noexcept {
  return (UINT32_MAX / bound) * bound;
}

// uniform_below draws a uniformly distributed value in [0, bound).
//
// Reads 4 bytes at a time, big-endian, redrawing while the value is at or
// above rejection_limit(bound). If the source fails it falls back to the clock's
// nanosecond count modulo bound; the call itself never fails.
// bound == 0 returns 0.
[[nodiscard]] std::uint32_t uniform_below(std::uint32_t bound, IRandomSource& source,
                                          core::IClock& clock);

}  // namespace idforge::flow
