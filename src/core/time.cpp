#include "flakeid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace flakeid::core {

namespace {

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

// has_prefix_shape checks "DDDD-DD-DDTDD:DD:DD" character by character.
bool has_prefix_shape(const std::string_view prefix) {
  constexpr std::string_view kShape = "DDDD-DD-DDTDD:DD:DD";
  if (prefix.size() != kShape.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kShape.size(); ++i) {
    if (kShape[i] == 'D' ? !is_digit(prefix[i]) : prefix[i] != kShape[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<Timestamp> parse_iso8601_utc(std::string_view text) {
  // Fixed-width prefix: YYYY-MM-DDTHH:MM:SS
  constexpr std::size_t kPrefixLength = 19;
  if (text.size() < kPrefixLength + 1 || text.back() != 'Z') {
    return std::nullopt;
  }

  if (!has_prefix_shape(text.substr(0, kPrefixLength))) {
    return std::nullopt;
  }

  std::tm tm{};
  std::istringstream iss{std::string{text.substr(0, kPrefixLength)}};
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }

  // Optional fractional seconds between the prefix and the trailing 'Z'.
  std::string_view rest = text.substr(kPrefixLength, text.size() - kPrefixLength - 1);
  std::int64_t nanos = 0;
  if (!rest.empty()) {
    if (rest.front() != '.' || rest.size() < 2 || rest.size() > 10) {
      return std::nullopt;
    }
    rest.remove_prefix(1);
    std::int64_t scale = 1000000000;
    for (const char c : rest) {
      if (!is_digit(c)) {
        return std::nullopt;
      }
      scale /= 10;
      nanos += (c - '0') * scale;
    }
  }

  // timegm interprets the broken-down time as UTC and normalises out-of-range fields, so a
  // changed field means the date does not exist (e.g. February 30th).
  const std::tm fields = tm;
  const std::time_t seconds = timegm(&tm);
  if (tm.tm_year != fields.tm_year || tm.tm_mon != fields.tm_mon ||
      tm.tm_mday != fields.tm_mday || tm.tm_hour != fields.tm_hour ||
      tm.tm_min != fields.tm_min || tm.tm_sec != fields.tm_sec) {
    return std::nullopt;
  }
  return Timestamp{std::chrono::duration_cast<Duration>(std::chrono::seconds{seconds} +
                                                        std::chrono::nanoseconds{nanos})};
}

std::string format_iso8601_utc(const Timestamp ts) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(ts.time_since_epoch());
  const auto time_t_value = static_cast<std::time_t>(seconds.count());
  std::tm tm{};
  gmtime_r(&time_t_value, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace flakeid::core
