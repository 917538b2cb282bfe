#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/bridge/progress_bridge.hpp"
#include "internal/engine/engines.hpp"

namespace scribe::engine {

class FfmpegExtractor final : public AudioExtractor {
 public:
  FfmpegExtractor(std::string ffmpeg_path, std::shared_ptr<scribe::bridge::ProgressBridge> bridge);

  void Extract(const std::filesystem::path& input, const std::filesystem::path& output, const AudioSpec& spec,
               double duration_hint, scribe::bridge::ProgressReporter& progress) override;

  std::vector<std::string> BuildCommand(const std::filesystem::path& input, const std::filesystem::path& output,
                                        const AudioSpec& spec) const;

 private:
  std::string                                     ffmpeg_path_;
  std::shared_ptr<scribe::bridge::ProgressBridge> bridge_;
};

} // namespace scribe::engine
