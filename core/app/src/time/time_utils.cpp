#include "qless/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace qless {

// -----------------------------------------------------------------------------
// formatIso8601(): gmtime_r + millisecond remainder
// -----------------------------------------------------------------------------
std::string formatIso8601(domain::Timestamp tp) {
  const std::int64_t ms = timestamp_to_ms(tp);
  std::int64_t seconds = ms / 1000;
  std::int64_t millis = ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&tt, &utc);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buf;
}

// -----------------------------------------------------------------------------
// parseDay(): strict YYYY-MM-DD, validated by round-tripping through timegm
// -----------------------------------------------------------------------------
std::optional<domain::Timestamp> parseDay(const std::string& day) {
  if (day.size() != 10 || day[4] != '-' || day[7] != '-') {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int mday = 0;
  char tail = '\0';
  if (std::sscanf(day.c_str(), "%4d-%2d-%2d%c", &year, &month, &mday,
                  &tail) != 3) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || mday < 1 || mday > 31) {
    return std::nullopt;
  }

  std::tm utc{};
  utc.tm_year = year - 1900;
  utc.tm_mon = month - 1;
  utc.tm_mday = mday;
  const std::time_t tt = timegm(&utc);

  // timegm normalizes Feb 30 to Mar 2; reject anything that moved.
  if (utc.tm_mday != mday || utc.tm_mon != month - 1) {
    return std::nullopt;
  }

  return std::chrono::system_clock::from_time_t(tt);
}

}  // namespace qless
