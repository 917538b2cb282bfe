#include "task_pipeline.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/ledger/ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/time.hpp"

namespace scribe::pipeline {

namespace fs = std::filesystem;

using scribe::model::TaskState;
using scribe::model::TranscriptionResult;
using scribe::model::WorkItem;
using scribe::util::ErrorKind;

std::string_view ToString(TaskOutcome outcome) {
  switch (outcome) {
    case TaskOutcome::kSuccess:
      return "success";
    case TaskOutcome::kFailed:
      return "failed";
    case TaskOutcome::kCancelled:
      return "cancelled";
  }
  return "failed";
}

namespace {

void Advance(TaskReport& report, TaskState next) {
  if (!scribe::model::CanTransition(report.state, next)) {
    throw std::logic_error("invalid task transition " + std::string(scribe::model::ToString(report.state)) + " -> " +
                           std::string(scribe::model::ToString(next)));
  }
  report.state = next;
}

bool IsBlank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

TaskPipeline::TaskPipeline(PipelineOptions options, std::shared_ptr<scribe::engine::MediaProbe> probe,
                           std::shared_ptr<scribe::engine::AudioExtractor>      extractor,
                           std::shared_ptr<scribe::engine::TranscriptionEngine> transcriber,
                           std::shared_ptr<scribe::ledger::Ledger> ledger, scribe::bridge::CancellationToken token)
    : options_(std::move(options)),
      probe_(std::move(probe)),
      extractor_(std::move(extractor)),
      transcriber_(std::move(transcriber)),
      ledger_(std::move(ledger)),
      token_(std::move(token)),
      serializer_(scribe::output::MakeSerializer(options_.format, options_.include_timestamps)) {
}

fs::path TaskPipeline::OutputPathFor(const WorkItem& item) const {
  return util::MirrorPath(options_.input_root, options_.output_root, item.path, serializer_->Extension());
}

fs::path TaskPipeline::TempAudioPathFor(const WorkItem& item) const {
  const auto stem = util::SanitizeFilename(item.path.stem().string());
  return options_.temp_dir / "audio" / (stem + "_" + item.identity.substr(0, 8) + ".wav");
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

TaskReport TaskPipeline::Run(const WorkItem& item, scribe::bridge::ProgressReporter& progress) const {
  const auto started = util::SteadyClock::now();

  TaskReport report;
  report.item        = item;
  report.output_path = OutputPathFor(item);

  const fs::path audio = TempAudioPathFor(item);

  auto checkpoint = [&](const char* stage) {
    if (token_.IsCancelled()) throw util::CancelledError(std::string("cancelled before ") + stage);
  };

  auto fail = [&](ErrorKind kind, const std::string& message) {
    report.outcome         = TaskOutcome::kFailed;
    report.error_kind      = kind;
    report.error           = message;
    report.processing_time = util::SecondsSince(started);
  };

  SCRIBE_LOG_INFO("task started", {observability::StringField("file", item.path.string())});

  try {
    checkpoint("validation");
    report.media_duration = Validate(item);
    Advance(report, TaskState::kValidated);

    checkpoint("extraction");
    {
      scribe::bridge::ProgressRange stage(progress, 0.0, kExtractWeight);
      extractor_->Extract(item.path, audio, options_.audio, report.media_duration, stage);
    }
    Advance(report, TaskState::kAudioExtracted);

    checkpoint("transcription");
    TranscriptionResult result;
    {
      scribe::bridge::ProgressRange stage(progress, kExtractWeight, kTranscribeWeight);
      result = transcriber_->Transcribe(audio, options_.language, report.media_duration, stage);
    }
    if (IsBlank(result.text)) {
      throw util::EmptyResultError("No text extracted from audio");
    }
    Advance(report, TaskState::kTranscribed);

    checkpoint("output");
    WriteOutputs(report, result);
    Advance(report, TaskState::kOutputWritten);

    report.outcome         = TaskOutcome::kSuccess;
    report.processing_time = util::SecondsSince(started);
  } catch (const util::CancelledError& e) {
    RemoveTemp(audio);
    report.outcome    = TaskOutcome::kCancelled;
    report.error_kind = ErrorKind::kCancelled;
    report.error      = e.what();
    report.state      = TaskState::kCancelled;

    SCRIBE_LOG_WARN("task cancelled", {observability::StringField("file", item.path.string())});
    observability::Metrics::Instance().RecordTask("cancelled", util::ToString(ErrorKind::kCancelled));
    return report;
  } catch (const util::ValidationError& e) {
    fail(ErrorKind::kValidation, e.what());
  } catch (const util::ExtractionError& e) {
    fail(ErrorKind::kExtraction, e.what());
    if (!e.diagnostics().empty()) {
      SCRIBE_LOG_DEBUG("extraction diagnostics", {observability::StringField("stderr", e.diagnostics())});
    }
  } catch (const util::TranscriptionError& e) {
    fail(ErrorKind::kTranscription, e.what());
    if (!e.diagnostics().empty()) {
      SCRIBE_LOG_DEBUG("transcription diagnostics", {observability::StringField("stderr", e.diagnostics())});
    }
  } catch (const util::EmptyResultError& e) {
    fail(ErrorKind::kEmptyResult, e.what());
  } catch (const util::PersistenceError& e) {
    fail(ErrorKind::kPersistence, e.what());
  } catch (const std::exception& e) {
    fail(ErrorKind::kInternal, e.what());
  }

  if (!options_.keep_temp) {
    RemoveTemp(audio);
  }

  // The ledger records successes and failures alike.
  try {
    RecordLedger(report);
    Advance(report, TaskState::kLedgerUpdated);
  } catch (const util::PersistenceError& e) {
    if (report.outcome == TaskOutcome::kSuccess) {
      fail(ErrorKind::kPersistence, e.what());
    }
    SCRIBE_LOG_ERROR("ledger update failed", {observability::StringField("file", item.path.string()),
                                              observability::StringField("error", e.what())});
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.ObserveTaskDurationMs(report.processing_time * 1000.0);

  if (report.outcome != TaskOutcome::kSuccess) {
    report.state = TaskState::kFailed;
    metrics.RecordTask("failed", util::ToString(report.error_kind));
    SCRIBE_LOG_ERROR("task failed", {observability::StringField("file", item.path.string()),
                                     observability::StringField("error_kind", util::ToString(report.error_kind)),
                                     observability::StringField("error", report.error)});
    return report;
  }

  // A failed move is logged; the task still succeeded.
  if (!options_.relocate_dir.empty() && Relocate(item)) {
    Advance(report, TaskState::kRelocated);
  }
  Advance(report, TaskState::kDone);
  progress.Report(1.0);

  metrics.RecordTask("success");
  if (report.media_duration > 0.0) {
    metrics.ObserveRealtimeFactor(report.processing_time / report.media_duration);
  }

  SCRIBE_LOG_INFO("task finished", {observability::StringField("file", item.path.string()),
                                    observability::StringField("output", report.output_path.string()),
                                    observability::DoubleField("duration_s", report.media_duration),
                                    observability::DoubleField("processing_s", report.processing_time)});
  return report;
}

// ------------------------------------------------------------
// Stages
// ------------------------------------------------------------

double TaskPipeline::Validate(const WorkItem& item) const {
  std::error_code ec;
  if (!fs::exists(item.path, ec)) {
    throw util::ValidationError("File does not exist: " + item.path.string());
  }
  if (!fs::is_regular_file(item.path, ec)) {
    throw util::ValidationError("Path is not a file: " + item.path.string());
  }
  const auto size = fs::file_size(item.path, ec);
  if (ec || size == 0) {
    throw util::ValidationError("File is empty: " + item.path.string());
  }

  scribe::engine::MediaInfo info;
  try {
    info = probe_->Probe(item.path);
  } catch (const util::CancelledError&) {
    throw;
  } catch (const util::EngineFailure& e) {
    throw util::ValidationError(std::string("Invalid media file: ") + e.what());
  }

  if (!info.has_audio) {
    throw util::ValidationError("No audio stream found in file");
  }
  if (!(info.duration > 0.0)) {
    throw util::ValidationError("Invalid or zero duration");
  }
  return info.duration;
}

void TaskPipeline::WriteOutputs(const TaskReport& report, const TranscriptionResult& result) const {
  util::WriteFileAtomic(report.output_path, serializer_->Render(result));

  if (options_.save_detailed_json && options_.format != scribe::output::OutputFormat::kStructured) {
    auto side_car = report.output_path;
    side_car.replace_extension(".json");
    util::WriteFileAtomic(side_car, scribe::output::StructuredSerializer().Render(result));
  }
}

void TaskPipeline::RecordLedger(const TaskReport& report) const {
  scribe::v1::LedgerEntry entry;
  entry.set_source_path(report.item.path.string());
  entry.set_processed_at(util::ToIso8601(util::Now()));
  entry.set_duration(report.media_duration);
  entry.set_processing_time(report.processing_time);
  entry.set_model_used(transcriber_->ModelName());
  entry.set_success(report.outcome == TaskOutcome::kSuccess);
  entry.set_source_mtime_ns(report.item.mtime_ns);
  entry.set_source_size(report.item.size_bytes);

  if (report.outcome == TaskOutcome::kSuccess) {
    entry.set_output_file(report.output_path.string());
  } else {
    entry.set_error(report.error);
    entry.set_error_kind(std::string(util::ToString(report.error_kind)));
  }

  ledger_->Record(report.item.identity, entry);
}

bool TaskPipeline::Relocate(const WorkItem& item) const {
  try {
    fs::create_directories(options_.relocate_dir);
    const auto destination = util::MoveToUniqueDestination(item.path, options_.relocate_dir);
    SCRIBE_LOG_INFO("source relocated", {observability::StringField("file", item.path.string()),
                                         observability::StringField("destination", destination.string())});
    return true;
  } catch (const fs::filesystem_error& e) {
    SCRIBE_LOG_WARN("relocation failed", {observability::StringField("file", item.path.string()),
                                          observability::StringField("error", e.what())});
    return false;
  }
}

void TaskPipeline::RemoveTemp(const fs::path& audio) const {
  std::error_code ec;
  fs::remove(audio, ec);
  if (ec) {
    SCRIBE_LOG_WARN("temp audio cleanup failed", {observability::StringField("path", audio.string()),
                                                  observability::StringField("error", ec.message())});
  }
}

} // namespace scribe::pipeline
