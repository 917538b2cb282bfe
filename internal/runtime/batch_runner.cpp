#include "batch_runner.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "internal/config/config_loader.hpp"
#include "internal/discovery/discovery.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/pipeline/task_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace scribe::runtime {

namespace fs = std::filesystem;

using scribe::model::WorkItem;
using scribe::runtime::config::RuntimeConfig;

namespace {

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

std::vector<std::string> AllowList(const RuntimeConfig& config) {
  const auto& formats = config.processing().supported_formats();
  return {formats.begin(), formats.end()};
}

std::string FormatMegabytes(uint64_t bytes) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
  return out.str();
}

bool FindOnPath(const std::string& program) {
  if (program.find('/') != std::string::npos) {
    return ::access(program.c_str(), X_OK) == 0;
  }
  const char* path = std::getenv("PATH");
  if (!path) return false;

  std::stringstream dirs(path);
  std::string       dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) dir = ".";
    if (::access((fs::path(dir) / program).c_str(), X_OK) == 0) return true;
  }
  return false;
}

} // namespace

BatchRunner::BatchRunner(RuntimeConfig config, scribe::factory::Engines engines,
                         scribe::bridge::CancellationToken token)
    : config_(std::move(config)),
      engines_(std::move(engines)),
      token_(std::move(token)),
      ledger_(std::make_shared<scribe::ledger::Ledger>(scribe::config::ConfigLoader::LedgerPath(config_))) {
}

BatchRunner::~BatchRunner() = default;

// ------------------------------------------------------------
// Setup validation
// ------------------------------------------------------------

std::vector<std::string> BatchRunner::ValidateSetup() const {
  auto issues = scribe::config::ConfigLoader::Validate(config_);
  if (!issues.empty()) return issues;

  const auto& processing = config_.processing();
  const fs::path input(processing.input_dir());

  std::error_code ec;
  if (!fs::exists(input, ec)) {
    issues.push_back("Input directory does not exist: " + input.string());
  } else if (!fs::is_directory(input, ec)) {
    issues.push_back("Input path is not a directory: " + input.string());
  } else if (::access(input.c_str(), R_OK) != 0) {
    issues.push_back("No read permission for input directory: " + input.string());
  } else if (scribe::discovery::Scan(input, processing.recursive(), AllowList(config_)).empty()) {
    issues.push_back("No media files found in input directory: " + input.string());
    issues.push_back("Supported formats: " + Join(AllowList(config_), ", "));
  }

  for (const fs::path dir : {fs::path(processing.output_dir()), fs::path(processing.temp_dir()) / "audio"}) {
    fs::create_directories(dir, ec);
    if (ec) {
      issues.push_back("Cannot create directory " + dir.string() + ": " + ec.message());
    } else if (::access(dir.c_str(), W_OK) != 0) {
      issues.push_back("No write permission for directory: " + dir.string());
    }
  }
  return issues;
}

std::vector<std::string> CheckEngineBinaries(const RuntimeConfig& config) {
  std::vector<std::string> missing;
  const auto&              engines = config.engines();

  for (const auto& program : {engines.ffmpeg_path(), engines.ffprobe_path(), engines.whisper_path()}) {
    if (!FindOnPath(program)) missing.push_back("Engine not found: " + program);
  }

  std::error_code ec;
  if (!engines.whisper_model_path().empty() && !fs::is_regular_file(engines.whisper_model_path(), ec)) {
    missing.push_back("Whisper model file not found: " + engines.whisper_model_path());
  }
  return missing;
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

BatchResult BatchRunner::Run(scribe::scheduler::Scheduler::ProgressCallback on_progress) {
  const auto started = util::SteadyClock::now();

  const auto issues = ValidateSetup();
  if (!issues.empty()) {
    throw util::SetupError(Join(issues, "; "));
  }

  ledger_->Load();

  const auto& processing = config_.processing();
  auto        options    = scribe::factory::BuildPipelineOptions(config_);
  auto        pipeline   = std::make_shared<scribe::pipeline::TaskPipeline>(
      options, engines_.probe, engines_.extractor, engines_.transcriber, ledger_, token_);
  auto stats = std::make_shared<scribe::stats::StatisticsAggregator>();

  std::vector<WorkItem> items;
  try {
    items = scribe::discovery::Scan(options.input_root, processing.recursive(), AllowList(config_));
  } catch (const util::NotFound& e) {
    throw util::SetupError(e.what());
  } catch (const util::NotADirectory& e) {
    throw util::SetupError(e.what());
  }
  stats->RecordDiscovered(items.size());

  std::vector<WorkItem> pending;
  pending.reserve(items.size());
  for (auto& item : items) {
    if (processing.skip_existing() && ledger_->ShouldSkip(item.identity, pipeline->OutputPathFor(item))) {
      SCRIBE_LOG_DEBUG("already processed, skipping", {observability::StringField("file", item.path.string())});
      stats->RecordSkipped();
      observability::Metrics::Instance().RecordTask("skipped");
      continue;
    }
    pending.push_back(std::move(item));
  }

  SCRIBE_LOG_INFO("processing plan", {observability::IntField("discovered", static_cast<int64_t>(items.size())),
                                      observability::IntField("pending", static_cast<int64_t>(pending.size())),
                                      observability::IntField("workers", processing.max_workers()),
                                      observability::BoolField("skip_existing", processing.skip_existing())});

  scribe::scheduler::Scheduler scheduler(pipeline, stats, token_, std::move(on_progress));
  scheduler.Run(pending, processing.max_workers());

  if (processing.cleanup_temp()) {
    SweepTemp(processing.keep_recent_temp());
  }

  BatchResult result;
  result.stats        = stats->Snapshot();
  result.failures     = stats->Failures();
  result.wall_seconds = util::SecondsSince(started);
  result.interrupted  = token_.IsCancelled();

  if (result.interrupted) {
    SCRIBE_LOG_WARN("run interrupted", {observability::IntField("cancelled", result.stats.cancelled)});
  }
  return result;
}

size_t BatchRunner::SweepTemp(size_t keep_recent) const {
  const fs::path dir = fs::path(config_.processing().temp_dir()) / "audio";

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return 0;

  std::vector<std::pair<fs::file_time_type, fs::path>> files;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec) || it->path().extension() != ".wav") continue;
    const auto mtime = it->last_write_time(ec);
    if (!ec) files.emplace_back(mtime, it->path());
  }

  // Newest first.
  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.first > b.first; });

  size_t deleted = 0;
  for (size_t i = keep_recent; i < files.size(); ++i) {
    if (fs::remove(files[i].second, ec)) {
      ++deleted;
    } else if (ec) {
      SCRIBE_LOG_WARN("failed to delete temp file", {observability::StringField("path", files[i].second.string()),
                                                     observability::StringField("error", ec.message())});
    }
  }

  if (deleted > 0) {
    SCRIBE_LOG_INFO("cleaned up temporary files", {observability::IntField("deleted", static_cast<int64_t>(deleted))});
  }
  return deleted;
}

// ------------------------------------------------------------
// Reporting
// ------------------------------------------------------------

void BatchRunner::PrintSummary(std::ostream& out, const BatchResult& result) const {
  const auto& s = result.stats;

  out << std::fixed << std::setprecision(1);
  out << "\nProcessing summary\n";
  out << "  Discovered:            " << s.total_discovered << "\n";
  out << "  Skipped:               " << s.skipped << "\n";
  out << "  Processed:             " << s.processed << "\n";
  out << "  Successful:            " << s.successful << "\n";
  out << "  Failed:                " << s.failed << "\n";
  if (s.cancelled > 0) {
    out << "  Cancelled:             " << s.cancelled << "\n";
  }
  if (s.processed > 0) {
    out << "  Success rate:          " << s.SuccessRate() * 100.0 << "%\n";
  }
  out << "  Total time:            " << result.wall_seconds << "s\n";
  out << "  Total audio duration:  " << s.total_duration << "s\n";
  out << "  Total processing time: " << s.total_processing_time << "s\n";
  if (s.total_duration > 0.0) {
    out << std::setprecision(3) << "  Average RTF:           " << s.RealtimeFactor() << "\n" << std::setprecision(1);
  }
  if (s.successful > 0) {
    out << "  Average time per file: " << s.AverageSecondsPerFile() << "s\n";
  }

  if (!result.failures.empty()) {
    out << "\nFailed files:\n";
    for (const auto& failure : result.failures) {
      out << "  " << failure.path << ": " << failure.error << "\n";
    }
  }
  if (result.interrupted) {
    out << "\nProcessing interrupted\n";
  }
}

void BatchRunner::PrintInventory(std::ostream& out) {
  const auto& processing = config_.processing();

  const auto items   = scribe::discovery::Scan(processing.input_dir(), processing.recursive(), AllowList(config_));
  const auto summary = scribe::discovery::Summarize(items);

  out << "Input: " << processing.input_dir() << "\n";
  out << "  Files: " << summary.total_files << " (" << FormatMegabytes(summary.total_bytes) << ")\n";
  for (const auto& [ext, entry] : summary.by_extension) {
    out << "  " << ext << ": " << entry.count << " (" << FormatMegabytes(entry.bytes) << ")\n";
  }

  ledger_->Load();
  const auto stats = ledger_->Stats();

  out << std::fixed << std::setprecision(1);
  out << "History: " << ledger_->path().string() << "\n";
  out << "  Total processed: " << stats.total_processed() << "\n";
  out << "  Successful:      " << stats.successful() << "\n";
  out << "  Failed:          " << stats.failed() << "\n";
  if (stats.total_processed() > 0) {
    out << "  Success rate:    "
        << static_cast<double>(stats.successful()) / static_cast<double>(stats.total_processed()) * 100.0 << "%\n";
  }
  out << "  Total duration:  " << stats.total_duration() << "s\n";
  out << "  Total processing time: " << stats.total_processing_time() << "s\n";
}

} // namespace scribe::runtime
