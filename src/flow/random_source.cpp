#include "idforge/flow/random_source.h"

#include "idforge/core/time.h"

#include <sys/random.h>

#include <array>
#include <cerrno>

namespace idforge::flow {

bool SystemRandomSource::fill(std::span<std::uint8_t> out) {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  return true;
}

IRandomSource& system_random() {
  static SystemRandomSource instance;
  return instance;
}

std::uint32_t uniform_below(const std::uint32_t bound, IRandomSource& source,
                            core::IClock& clock) {
  if (bound == 0) {
    return 0;
  }

  const std::uint32_t limit = rejection_limit(bound);
  std::array<std::uint8_t, 4> bytes{};

  while (true) {
    if (!source.fill(bytes)) {
      const std::int64_t nanos = core::to_unix_nanos(clock.now());
      const std::int64_t fallback = nanos % static_cast<std::int64_t>(bound);
      return static_cast<std::uint32_t>(fallback < 0 ? fallback + bound : fallback);
    }

    const std::uint32_t value = (static_cast<std::uint32_t>(bytes[0]) << 24u) |
                                (static_cast<std::uint32_t>(bytes[1]) << 16u) |
                                (static_cast<std::uint32_t>(bytes[2]) << 8u) |
                                static_cast<std::uint32_t>(bytes[3]);
    if (value < limit) {
      return value % bound;
    }
  }
}

}  // namespace idforge::flow
