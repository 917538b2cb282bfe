#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/bridge/progress_bridge.hpp"
#include "internal/engine/ffmpeg_extractor.hpp"
#include "internal/engine/ffprobe_probe.hpp"
#include "internal/engine/whisper_cli_engine.hpp"

namespace scribe::factory {

using scribe::runtime::config::RuntimeConfig;

Engines BuildEngines(const RuntimeConfig& config, const scribe::bridge::CancellationToken& token) {
  const auto& engines = config.engines();

  scribe::bridge::BridgeOptions long_running;
  long_running.stall_timeout = std::chrono::milliseconds(engines.stall_timeout_ms());
  long_running.kill_grace    = std::chrono::milliseconds(engines.kill_grace_ms());
  long_running.max_runtime   = std::chrono::milliseconds(engines.max_runtime_ms());

  // ffprobe prints nothing until it is done, so only the hard limit applies.
  scribe::bridge::BridgeOptions probe = long_running;
  probe.stall_timeout                 = std::chrono::milliseconds(0);
  probe.max_runtime                   = std::chrono::milliseconds(engines.probe_timeout_ms());

  auto bridge       = std::make_shared<scribe::bridge::ProgressBridge>(long_running, token);
  auto probe_bridge = std::make_shared<scribe::bridge::ProgressBridge>(probe, token);

  scribe::engine::WhisperOptions whisper;
  whisper.whisper_path = engines.whisper_path();
  whisper.model_path   = engines.whisper_model_path();
  whisper.model_name   = config.processing().model_name();
  whisper.threads      = engines.whisper_threads();

  Engines out;
  out.probe       = std::make_shared<scribe::engine::FfprobeProbe>(engines.ffprobe_path(), probe_bridge);
  out.extractor   = std::make_shared<scribe::engine::FfmpegExtractor>(engines.ffmpeg_path(), bridge);
  out.transcriber = std::make_shared<scribe::engine::WhisperCliEngine>(whisper, bridge);
  return out;
}

scribe::pipeline::PipelineOptions BuildPipelineOptions(const RuntimeConfig& config) {
  const auto& processing = config.processing();

  const auto format = scribe::output::ParseOutputFormat(processing.output_format());
  if (!format) {
    throw std::invalid_argument("unknown output format: " + processing.output_format());
  }

  scribe::pipeline::PipelineOptions options;
  options.input_root         = std::filesystem::absolute(processing.input_dir()).lexically_normal();
  options.output_root        = std::filesystem::absolute(processing.output_dir()).lexically_normal();
  options.temp_dir           = processing.temp_dir();
  options.relocate_dir       = processing.relocate_dir();
  options.format             = *format;
  options.include_timestamps = processing.include_timestamps();
  options.save_detailed_json = processing.save_detailed_json();
  options.keep_temp          = !processing.cleanup_temp();
  options.language           = processing.language();

  options.audio.sample_rate    = config.audio().sample_rate();
  options.audio.channels       = config.audio().channels();
  options.audio.normalize      = config.audio().normalize_audio();
  options.audio.remove_silence = config.audio().remove_silence();
  return options;
}

} // namespace scribe::factory
