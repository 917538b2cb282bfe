#include "timestamp.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace scribe::output {

namespace {

struct ClockParts {
  int64_t hours;
  int64_t minutes;
  int64_t seconds;
  int64_t millis;
};

// Larger values and infinity saturate here.
constexpr double kMaxSeconds = 1e12;

ClockParts Split(double seconds) {
  if (!(seconds > 0.0)) {
    return {0, 0, 0, 0};
  }
  if (!std::isfinite(seconds) || seconds > kMaxSeconds) {
    seconds = kMaxSeconds;
  }

  const double  whole = std::floor(seconds);
  const int64_t total = static_cast<int64_t>(whole);

  auto millis = static_cast<int64_t>((seconds - whole) * 1000.0);
  if (millis > 999) millis = 999;

  return {total / 3600, (total % 3600) / 60, total % 60, millis};
}

std::string Render(double seconds, char separator) {
  const auto parts = Split(seconds);

  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld%c%03lld", static_cast<long long>(parts.hours),
                static_cast<long long>(parts.minutes), static_cast<long long>(parts.seconds), separator,
                static_cast<long long>(parts.millis));
  return buffer;
}

} // namespace

std::string FormatClock(double seconds) {
  const auto parts = Split(seconds);

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld", static_cast<long long>(parts.hours),
                static_cast<long long>(parts.minutes), static_cast<long long>(parts.seconds));
  return buffer;
}

std::string FormatSubtitleTimestamp(double seconds) {
  return Render(seconds, ',');
}

std::string FormatWebSubtitleTimestamp(double seconds) {
  return Render(seconds, '.');
}

} // namespace scribe::output
