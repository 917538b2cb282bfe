#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/bridge/cancellation.hpp"
#include "internal/bridge/progress_reporter.hpp"
#include "internal/engine/engines.hpp"
#include "internal/model/task_state.hpp"
#include "internal/model/work_item.hpp"
#include "internal/output/serializer.hpp"
#include "internal/util/errors.hpp"

namespace scribe::ledger {
class Ledger;
}

namespace scribe::pipeline {

struct PipelineOptions {
  std::filesystem::path input_root;
  std::filesystem::path output_root;
  std::filesystem::path temp_dir;
  // Empty disables relocation.
  std::filesystem::path relocate_dir;

  scribe::output::OutputFormat format             = scribe::output::OutputFormat::kText;
  bool                         include_timestamps = false;
  bool                         save_detailed_json = false;
  bool                         keep_temp          = false;

  std::string               language{"auto"};
  scribe::engine::AudioSpec audio;
};

enum class TaskOutcome {
  kSuccess,
  kFailed,
  kCancelled,
};

std::string_view ToString(TaskOutcome outcome);

struct TaskReport {
  scribe::model::WorkItem  item;
  scribe::model::TaskState state      = scribe::model::TaskState::kPending;
  TaskOutcome              outcome    = TaskOutcome::kFailed;
  scribe::util::ErrorKind  error_kind = scribe::util::ErrorKind::kNone;
  std::string              error;

  std::filesystem::path output_path;
  double                media_duration  = 0.0;
  double                processing_time = 0.0;
};

/*
  Runs one work item end to end:

      validate → extract → transcribe → write output → ledger → relocate

  Every failure is caught here and converted into a ledger entry; Run never
  throws for per-file problems. Cancellation is checked before each stage
  and ends the task without a ledger entry.
*/
class TaskPipeline {
 public:
  // Extraction covers the first 30% of a task's progress.
  static constexpr double kExtractWeight    = 0.3;
  static constexpr double kTranscribeWeight = 0.7;

  TaskPipeline(PipelineOptions options, std::shared_ptr<scribe::engine::MediaProbe> probe,
               std::shared_ptr<scribe::engine::AudioExtractor>      extractor,
               std::shared_ptr<scribe::engine::TranscriptionEngine> transcriber,
               std::shared_ptr<scribe::ledger::Ledger> ledger, scribe::bridge::CancellationToken token);

  TaskReport Run(const scribe::model::WorkItem& item, scribe::bridge::ProgressReporter& progress) const;

  std::filesystem::path OutputPathFor(const scribe::model::WorkItem& item) const;
  std::filesystem::path TempAudioPathFor(const scribe::model::WorkItem& item) const;

  const PipelineOptions& options() const {
    return options_;
  }

 private:
  double Validate(const scribe::model::WorkItem& item) const;
  void   WriteOutputs(const TaskReport& report, const scribe::model::TranscriptionResult& result) const;
  void   RecordLedger(const TaskReport& report) const;
  bool   Relocate(const scribe::model::WorkItem& item) const;
  void   RemoveTemp(const std::filesystem::path& audio) const;

  PipelineOptions                                      options_;
  std::shared_ptr<scribe::engine::MediaProbe>          probe_;
  std::shared_ptr<scribe::engine::AudioExtractor>      extractor_;
  std::shared_ptr<scribe::engine::TranscriptionEngine> transcriber_;
  std::shared_ptr<scribe::ledger::Ledger>              ledger_;
  scribe::bridge::CancellationToken                    token_;
  std::unique_ptr<scribe::output::OutputSerializer>    serializer_;
};

} // namespace scribe::pipeline
