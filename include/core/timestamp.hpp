#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace load_bench::core {

using SteadyClock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = WallClock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

// strftime() over local time; falls back to an empty string when the format overflows.
inline std::string format_wall_clock(const WallClock::time_point point, const char* format) {
  const std::time_t seconds = WallClock::to_time_t(point);
  std::tm local{};
  localtime_r(&seconds, &local);

  char buffer[64]{};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), format, &local);
  return std::string(buffer, written);
}

inline float elapsed_ms(const SteadyClock::time_point since, const SteadyClock::time_point until = SteadyClock::now()) {
  return std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(until - since).count();
}

}  // namespace load_bench::core
