#pragma once

#include <string_view>

namespace scribe::bridge {

struct ProgressEvent {
  enum class Kind {
    kNone,
    kPosition,  // seconds of media processed
    kRatio,     // already a fraction
    kEnd,
  };

  Kind   kind  = Kind::kNone;
  double value = 0.0;
};

/*
  Interprets one line of engine output.
*/
class ProgressParser {
 public:
  virtual ~ProgressParser() = default;

  virtual ProgressEvent Parse(std::string_view line) = 0;
};

/*
  ffmpeg -progress pipe:1 key=value stream.

      out_time_us=1500000
      out_time_ms=1500000     (also microseconds)
      out_time=00:00:01.500000
      progress=end
*/
class FfmpegProgressParser final : public ProgressParser {
 public:
  ProgressEvent Parse(std::string_view line) override;
};

// whisper CLI progress lines: "... progress =  42%".
class WhisperProgressParser final : public ProgressParser {
 public:
  ProgressEvent Parse(std::string_view line) override;
};

// For engines whose output carries no progress.
class NullProgressParser final : public ProgressParser {
 public:
  ProgressEvent Parse(std::string_view) override {
    return {};
  }
};

// "HH:MM:SS.ffffff" to seconds; negative on malformed input.
double ParseClockSeconds(std::string_view value);

} // namespace scribe::bridge
