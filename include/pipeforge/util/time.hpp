#pragma once

#include <chrono>
#include <format>
#include <string>

namespace pipeforge::util {

// YYYY-MM-DDTHH:MM:SSZ, empty for the epoch
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{}) {
    return {};
  }
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto elapsed_ms(std::chrono::steady_clock::time_point from,
                                     std::chrono::steady_clock::time_point to)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
      .count();
}

} // namespace pipeforge::util
