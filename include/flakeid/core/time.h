#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ratio>
#include <string>
#include <string_view>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
// Microsecond resolution keeps instants hundreds of millennia away from overflow, well past
// the 697-year range of the 41-bit tick field.
using Duration = std::chrono::microseconds;
using Timestamp = std::chrono::time_point<Clock, Duration>;

// Tick is the generator's time resolution: 10 milliseconds.
using Tick = std::chrono::duration<std::int64_t, std::centi>;

// kDefaultStartTime is the epoch used when none is configured: 2021-10-01T00:00:00Z.
inline constexpr Timestamp kDefaultStartTime{std::chrono::seconds{1633046400}};

inline Timestamp now_utc() { return std::chrono::time_point_cast<Duration>(Clock::now()); }

// to_ticks counts whole 10 ms ticks since the Unix epoch (truncating).
inline std::int64_t to_ticks(const Timestamp ts) {
  return std::chrono::duration_cast<Tick>(ts.time_since_epoch()).count();
}

// from_ticks returns the instant at which the given tick begins.
inline Timestamp from_ticks(const std::int64_t ticks) {
  return Timestamp{std::chrono::duration_cast<Duration>(Tick{ticks})};
}

// parse_iso8601_utc accepts "YYYY-MM-DDTHH:MM:SSZ" with an optional fractional part of up to
// nine digits before the 'Z'. Returns nullopt for anything else.
[[nodiscard]] std::optional<Timestamp> parse_iso8601_utc(std::string_view text);

// format_iso8601_utc renders whole seconds, e.g. "2021-10-01T00:00:00Z".
[[nodiscard]] std::string format_iso8601_utc(Timestamp ts);

}  // namespace flakeid::core
