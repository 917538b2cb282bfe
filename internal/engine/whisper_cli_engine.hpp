#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/bridge/progress_bridge.hpp"
#include "internal/engine/engines.hpp"

namespace scribe::engine {

struct WhisperOptions {
  std::string whisper_path{"whisper-cli"};
  std::string model_path;
  std::string model_name{"medium"};
  uint32_t    threads = 0;  // 0 keeps the tool's default
};

/*
  Speech-to-text through the whisper.cpp command-line tool.

  The tool writes a full JSON document (-ojf) next to the audio file; that
  document is parsed into a TranscriptionResult and removed.
*/
class WhisperCliEngine final : public TranscriptionEngine {
 public:
  WhisperCliEngine(WhisperOptions options, std::shared_ptr<scribe::bridge::ProgressBridge> bridge);

  scribe::model::TranscriptionResult Transcribe(const std::filesystem::path& audio, const std::string& language_hint,
                                                double duration_hint,
                                                scribe::bridge::ProgressReporter& progress) override;

  std::string ModelName() const override {
    return options_.model_name;
  }

  std::vector<std::string> BuildCommand(const std::filesystem::path& audio, const std::filesystem::path& output_prefix,
                                        const std::string& language_hint) const;

  // Exposed for tests.
  static scribe::model::TranscriptionResult ParseResultJson(const std::string& json, const std::string& language_hint);

 private:
  WhisperOptions                                  options_;
  std::shared_ptr<scribe::bridge::ProgressBridge> bridge_;
};

} // namespace scribe::engine
