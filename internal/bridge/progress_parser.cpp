#include "progress_parser.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace scribe::bridge {

namespace {

std::string_view TrimView(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) value.remove_suffix(1);
  return value;
}

bool ParseInt(std::string_view value, int64_t& out) {
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  return ec == std::errc() && ptr == value.data() + value.size();
}

bool ParseDouble(std::string_view value, double& out) {
  // from_chars for double is not available on every libstdc++ in use.
  if (value.empty()) return false;
  std::string copy(value);
  char*       end = nullptr;
  out             = std::strtod(copy.c_str(), &end);
  return end == copy.c_str() + copy.size();
}

ProgressEvent Position(double seconds) {
  if (seconds < 0.0) return {};
  return {ProgressEvent::Kind::kPosition, seconds};
}

} // namespace

double ParseClockSeconds(std::string_view value) {
  value = TrimView(value);

  const auto first = value.find(':');
  if (first == std::string_view::npos) return -1.0;
  const auto second = value.find(':', first + 1);
  if (second == std::string_view::npos) return -1.0;

  int64_t hours   = 0;
  int64_t minutes = 0;
  double  seconds = 0.0;
  if (!ParseInt(value.substr(0, first), hours) || !ParseInt(value.substr(first + 1, second - first - 1), minutes) ||
      !ParseDouble(value.substr(second + 1), seconds)) {
    return -1.0;
  }
  if (hours < 0 || minutes < 0 || seconds < 0.0) return -1.0;

  return static_cast<double>(hours) * 3600.0 + static_cast<double>(minutes) * 60.0 + seconds;
}

// ------------------------------------------------------------
// ffmpeg
// ------------------------------------------------------------

ProgressEvent FfmpegProgressParser::Parse(std::string_view line) {
  line          = TrimView(line);
  const auto eq = line.find('=');
  if (eq == std::string_view::npos) return {};

  const auto key   = TrimView(line.substr(0, eq));
  const auto value = TrimView(line.substr(eq + 1));

  if (key == "progress") {
    if (value == "end") return {ProgressEvent::Kind::kEnd, 1.0};
    return {};
  }

  if (key == "out_time_us" || key == "out_time_ms") {
    int64_t micros = 0;
    if (!ParseInt(value, micros)) return {};
    return Position(static_cast<double>(micros) / 1'000'000.0);
  }

  if (key == "out_time") {
    return Position(ParseClockSeconds(value));
  }

  return {};
}

// ------------------------------------------------------------
// whisper
// ------------------------------------------------------------

ProgressEvent WhisperProgressParser::Parse(std::string_view line) {
  const auto key = line.find("progress");
  if (key == std::string_view::npos) return {};

  auto rest = line.substr(key + 8);
  auto eq   = rest.find('=');
  auto pct  = rest.find('%');
  if (eq == std::string_view::npos || pct == std::string_view::npos || pct < eq) return {};

  double percent = 0.0;
  if (!ParseDouble(TrimView(rest.substr(eq + 1, pct - eq - 1)), percent)) return {};
  if (percent < 0.0) return {};

  if (percent >= 100.0) return {ProgressEvent::Kind::kEnd, 1.0};
  return {ProgressEvent::Kind::kRatio, percent / 100.0};
}

} // namespace scribe::bridge
