#pragma once

#include <memory>
#include <string>

#include "internal/bridge/progress_bridge.hpp"
#include "internal/engine/engines.hpp"

namespace scribe::engine {

class FfprobeProbe final : public MediaProbe {
 public:
  FfprobeProbe(std::string ffprobe_path, std::shared_ptr<scribe::bridge::ProgressBridge> bridge);

  MediaInfo Probe(const std::filesystem::path& input) override;

  // Exposed for tests: interprets `ffprobe -print_format json` output.
  static MediaInfo ParseProbeJson(const std::string& json);

 private:
  std::string                                     ffprobe_path_;
  std::shared_ptr<scribe::bridge::ProgressBridge> bridge_;
};

} // namespace scribe::engine
