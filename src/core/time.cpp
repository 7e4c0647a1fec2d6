#include "idforge/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace idforge::core {

std::string format_compact_local(const Timestamp ts) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
  const std::time_t time_t_value = Clock::to_time_t(seconds);

  // localtime_r: std::localtime shares a static buffer across threads.
  // Without a usable zone database the rendering degrades to UTC.
  std::tm local{};
  if (localtime_r(&time_t_value, &local) == nullptr) {
    gmtime_r(&time_t_value, &local);
  }

  std::ostringstream oss;
  oss << std::put_time(&local, "%Y%m%d%H%M%S");
  return oss.str();
}

int millis_of_second(const Timestamp ts) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
  return static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(ts - seconds).count());
}

}  // namespace idforge::core
