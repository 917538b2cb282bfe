#include "ffmpeg_extractor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace scribe::engine {

namespace fs = std::filesystem;

FfmpegExtractor::FfmpegExtractor(std::string ffmpeg_path, std::shared_ptr<scribe::bridge::ProgressBridge> bridge)
    : ffmpeg_path_(std::move(ffmpeg_path)), bridge_(std::move(bridge)) {
}

std::vector<std::string> FfmpegExtractor::BuildCommand(const fs::path& input, const fs::path& output,
                                                       const AudioSpec& spec) const {
  std::vector<std::string> argv = {ffmpeg_path_, "-hide_banner", "-nostdin", "-loglevel", "error"};

  // key=value progress on stdout; errors on stderr.
  argv.insert(argv.end(), {"-progress", "pipe:1"});
  argv.insert(argv.end(), {"-i", input.string(), "-vn"});
  argv.insert(argv.end(), {"-acodec", "pcm_s16le"});
  argv.insert(argv.end(), {"-ar", std::to_string(spec.sample_rate)});
  argv.insert(argv.end(), {"-ac", std::to_string(spec.channels)});

  std::string filters;
  if (spec.normalize) {
    filters = "loudnorm";
  }
  if (spec.remove_silence) {
    if (!filters.empty()) filters += ',';
    filters += "silenceremove=start_periods=1:start_duration=0.1:start_threshold=-50dB";
  }
  if (!filters.empty()) {
    argv.push_back("-af");
    argv.push_back(filters);
  }

  argv.push_back("-y");
  argv.push_back(output.string());
  return argv;
}

void FfmpegExtractor::Extract(const fs::path& input, const fs::path& output, const AudioSpec& spec,
                              double duration_hint, scribe::bridge::ProgressReporter& progress) {
  std::error_code ec;
  fs::create_directories(output.parent_path(), ec);
  if (ec) {
    throw util::ExtractionError("cannot create temp audio directory " + output.parent_path().string() + ": " +
                                ec.message());
  }

  scribe::bridge::FfmpegProgressParser parser;

  try {
    auto result = bridge_->Run(BuildCommand(input, output, spec), duration_hint, parser, progress);
    observability::Metrics::Instance().ObserveEngineDurationMs("ffmpeg", result.elapsed_seconds * 1000.0);
  } catch (const util::CancelledError&) {
    fs::remove(output, ec);
    throw;
  } catch (const util::EngineFailure& e) {
    fs::remove(output, ec);
    throw util::ExtractionError(std::string("audio extraction failed: ") + e.what(), e.diagnostics());
  }

  if (!fs::is_regular_file(output, ec) || fs::file_size(output, ec) == 0) {
    fs::remove(output, ec);
    throw util::ExtractionError("audio extraction produced no output: " + output.string());
  }

  progress.Report(1.0);
  SCRIBE_LOG_DEBUG("audio extracted", {observability::StringField("input", input.string()),
                                       observability::StringField("audio", output.string())});
}

} // namespace scribe::engine
