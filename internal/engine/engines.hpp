#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "internal/bridge/progress_reporter.hpp"
#include "internal/model/transcription_result.hpp"

namespace scribe::engine {

/*
  External collaborators of the task pipeline.

  Implementations:
    FfprobeProbe      → ffprobe JSON
    FfmpegExtractor   → ffmpeg -progress pipe:1
    WhisperCliEngine  → whisper.cpp command-line tool

  Tests substitute in-process fakes.
*/

struct MediaInfo {
  double duration  = 0.0;
  bool   has_audio = false;
  bool   has_video = false;
};

struct AudioSpec {
  uint32_t sample_rate    = 16000;
  uint32_t channels       = 1;
  bool     normalize      = false;
  bool     remove_silence = false;
};

class MediaProbe {
 public:
  virtual ~MediaProbe() = default;

  // Throws EngineFailure when the file cannot be read as media.
  virtual MediaInfo Probe(const std::filesystem::path& input) = 0;
};

class AudioExtractor {
 public:
  virtual ~AudioExtractor() = default;

  /*
    Decode the audio track of input into output as PCM WAV.

    Throws ExtractionError, or CancelledError. Progress is reported against
    duration_hint seconds of media.
  */
  virtual void Extract(const std::filesystem::path& input, const std::filesystem::path& output, const AudioSpec& spec,
                       double duration_hint, scribe::bridge::ProgressReporter& progress) = 0;
};

class TranscriptionEngine {
 public:
  virtual ~TranscriptionEngine() = default;

  // language_hint "auto" lets the engine detect the language.
  virtual scribe::model::TranscriptionResult Transcribe(const std::filesystem::path& audio,
                                                        const std::string& language_hint, double duration_hint,
                                                        scribe::bridge::ProgressReporter& progress) = 0;

  virtual std::string ModelName() const = 0;
};

} // namespace scribe::engine
