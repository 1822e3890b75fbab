#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <string>

namespace contentflow::util {

using TimePoint = std::chrono::system_clock::time_point;

// Formats time point to ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  auto const sec_tp = std::chrono::floor<std::chrono::seconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", sec_tp);
}

[[nodiscard]] inline auto to_local_tm(TimePoint tp) -> std::tm {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

// Local calendar date in the "Mon Jan 15 2024" form used for the daily marker.
[[nodiscard]] inline auto local_date_string(TimePoint tp) -> std::string {
  auto tm = to_local_tm(tp);
  std::array<char, 32> buf{};
  const auto n = std::strftime(buf.data(), buf.size(), "%a %b %d %Y", &tm);
  return std::string(buf.data(), n);
}

// Local timestamp (YYYY-MM-DD HH:MM:SS), "-" for the epoch sentinel.
[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  auto tm = to_local_tm(tp);
  std::array<char, 32> buf{};
  const auto n =
      std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf.data(), n);
}

// First local midnight strictly after `tp`. mktime normalises the day
// overflow and resolves DST with tm_isdst = -1.
[[nodiscard]] inline auto next_local_midnight(TimePoint tp) -> TimePoint {
  auto tm = to_local_tm(tp);
  tm.tm_mday += 1;
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> TimePoint {
  return TimePoint{std::chrono::milliseconds{millis}};
}

} // namespace contentflow::util
