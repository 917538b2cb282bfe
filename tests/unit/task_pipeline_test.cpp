#include "internal/pipeline/task_pipeline.hpp"

#include <cassert>
#include <iostream>
#include <vector>

#include "internal/discovery/discovery.hpp"
#include "internal/ledger/ledger.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using scribe::model::TaskState;
using scribe::pipeline::PipelineOptions;
using scribe::pipeline::TaskOutcome;
using scribe::pipeline::TaskPipeline;
using scribe::testing::ReadFile;
using scribe::testing::TempDir;
using scribe::testing::WriteFile;
using scribe::util::ErrorKind;

struct Fixture {
  explicit Fixture(const std::string& name) : dir(name) {
    options.input_root  = dir.path() / "in";
    options.output_root = dir.path() / "out";
    options.temp_dir    = dir.path() / "tmp";
    fs::create_directories(options.input_root);

    ledger = std::make_shared<scribe::ledger::Ledger>(dir.path() / "out" / ".processing_history.json");
  }

  std::shared_ptr<TaskPipeline> Pipeline() {
    return std::make_shared<TaskPipeline>(options, probe, extractor, transcriber, ledger, token);
  }

  scribe::model::WorkItem Item(const std::string& relative, const std::string& content) {
    const auto path = options.input_root / relative;
    WriteFile(path, content);
    for (const auto& item : scribe::discovery::Scan(options.input_root, true, {".mp4", ".mp3", ".wav"})) {
      if (item.path == fs::absolute(path).lexically_normal()) return item;
    }
    assert(false && "item not discovered");
    return {};
  }

  TempDir                                         dir;
  PipelineOptions                                 options;
  std::shared_ptr<scribe::testing::FakeProbe>     probe       = std::make_shared<scribe::testing::FakeProbe>();
  std::shared_ptr<scribe::testing::FakeExtractor> extractor   = std::make_shared<scribe::testing::FakeExtractor>();
  std::shared_ptr<scribe::testing::FakeTranscriber> transcriber =
      std::make_shared<scribe::testing::FakeTranscriber>();
  std::shared_ptr<scribe::ledger::Ledger> ledger;
  scribe::bridge::CancellationToken       token;
};

void TestSuccessWritesOutputAndLedger() {
  Fixture f("pipeline_success");
  auto    pipeline = f.Pipeline();
  auto    item     = f.Item("lectures/week1.mp4", "media");

  std::vector<double>               seen;
  scribe::bridge::MonotonicProgress progress([&](double v) { seen.push_back(v); });

  const auto report = pipeline->Run(item, progress);

  assert(report.outcome == TaskOutcome::kSuccess);
  assert(report.state == TaskState::kDone);
  assert(report.error_kind == ErrorKind::kNone);
  assert(report.media_duration == 10.0);
  assert(report.output_path == f.options.output_root / "lectures" / "week1.txt");
  assert(ReadFile(report.output_path) == "hello world\n");

  assert(!seen.empty());
  assert(seen.back() == 1.0);
  for (size_t i = 1; i < seen.size(); ++i) assert(seen[i] > seen[i - 1]);

  const auto entry = f.ledger->Get(item.identity);
  assert(entry.has_value());
  assert(entry->success());
  assert(entry->output_file() == report.output_path.string());
  assert(entry->model_used() == "fake-model");
  assert(entry->duration() == 10.0);

  // Temp audio is gone once the task is done.
  assert(!fs::exists(pipeline->TempAudioPathFor(item)));
  assert(f.ledger->ShouldSkip(item.identity, report.output_path));
}

void TestEmptySourceFailsValidation() {
  Fixture f("pipeline_empty");
  auto    item = f.Item("blank.mp4", "");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = f.Pipeline()->Run(item, progress);

  assert(report.outcome == TaskOutcome::kFailed);
  assert(report.state == TaskState::kFailed);
  assert(report.error_kind == ErrorKind::kValidation);
  assert(f.probe->calls == 0);
  assert(f.extractor->calls == 0);

  const auto entry = f.ledger->Get(item.identity);
  assert(entry.has_value());
  assert(!entry->success());
  assert(entry->error_kind() == "ValidationError");
  assert(!fs::exists(report.output_path));
}

void TestSourceWithoutAudioFails() {
  Fixture f("pipeline_noaudio");
  auto    item = f.Item("screen.mp4", "noaudio");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = f.Pipeline()->Run(item, progress);

  assert(report.error_kind == ErrorKind::kValidation);
  assert(report.error.find("No audio stream") != std::string::npos);
  assert(f.extractor->calls == 0);
}

void TestExtractionFailureIsRecorded() {
  Fixture f("pipeline_corrupt");
  auto    item = f.Item("broken.mp4", "corrupt");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = f.Pipeline()->Run(item, progress);

  assert(report.outcome == TaskOutcome::kFailed);
  assert(report.error_kind == ErrorKind::kExtraction);
  assert(f.transcriber->calls == 0);
  assert(f.ledger->Get(item.identity)->error_kind() == "ExtractionError");
}

void TestEmptyTranscriptIsSoftFailure() {
  Fixture f("pipeline_silent");
  auto    pipeline = f.Pipeline();
  auto    item     = f.Item("quiet.mp3", "silent");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = pipeline->Run(item, progress);

  assert(report.outcome == TaskOutcome::kFailed);
  assert(report.error_kind == ErrorKind::kEmptyResult);
  assert(report.error == "No text extracted from audio");
  assert(!fs::exists(report.output_path));
  assert(!fs::exists(pipeline->TempAudioPathFor(item)));
}

void TestTranscriptionFailure() {
  Fixture f("pipeline_garbled");
  auto    item = f.Item("noise.wav", "garbled");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = f.Pipeline()->Run(item, progress);

  assert(report.error_kind == ErrorKind::kTranscription);
  assert(f.ledger->Stats().failed() == 1);
}

void TestCancellationLeavesNoLedgerEntry() {
  Fixture f("pipeline_cancel");
  f.extractor->on_extract = [&] { f.token.Cancel(); };
  auto pipeline           = f.Pipeline();
  auto item               = f.Item("long.mp4", "media");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = pipeline->Run(item, progress);

  assert(report.outcome == TaskOutcome::kCancelled);
  assert(report.state == TaskState::kCancelled);
  assert(f.transcriber->calls == 0);
  assert(!f.ledger->Get(item.identity).has_value());
  assert(f.ledger->Size() == 0);
  assert(!fs::exists(pipeline->TempAudioPathFor(item)));
  assert(!fs::exists(report.output_path));
}

void TestDetailedJsonSideCar() {
  Fixture f("pipeline_sidecar");
  f.options.format             = scribe::output::OutputFormat::kSubtitle;
  f.options.save_detailed_json = true;
  auto item                    = f.Item("talk.mp4", "media");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = f.Pipeline()->Run(item, progress);

  assert(report.outcome == TaskOutcome::kSuccess);
  assert(report.output_path.extension() == ".srt");
  assert(ReadFile(report.output_path).find("00:00:01,500 --> 00:00:03,000") != std::string::npos);

  const auto side_car = ReadFile(f.options.output_root / "talk.json");
  assert(side_car.find("\"model_used\": \"fake-model\"") != std::string::npos);
  assert(side_car.find("\"total_segments\": 2") != std::string::npos);
}

void TestRelocationAvoidsCollisions() {
  Fixture f("pipeline_relocate");
  f.options.relocate_dir = f.dir.path() / "done";
  WriteFile(f.options.relocate_dir / "clip.mp4", "older");
  auto item = f.Item("clip.mp4", "media");

  scribe::bridge::MonotonicProgress progress;
  const auto                        report = f.Pipeline()->Run(item, progress);

  assert(report.outcome == TaskOutcome::kSuccess);
  assert(report.state == TaskState::kDone);
  assert(!fs::exists(item.path));
  assert(ReadFile(f.options.relocate_dir / "clip_1.mp4") == "media");
  assert(ReadFile(f.options.relocate_dir / "clip.mp4") == "older");
}

void TestKeepTempRetainsAudio() {
  Fixture f("pipeline_keep_temp");
  f.options.keep_temp = true;
  auto pipeline       = f.Pipeline();
  auto item           = f.Item("keep.mp4", "media");

  scribe::bridge::MonotonicProgress progress;
  (void)pipeline->Run(item, progress);

  const auto audio = pipeline->TempAudioPathFor(item);
  assert(fs::exists(audio));
  assert(audio.parent_path() == f.options.temp_dir / "audio");
  assert(audio.filename().string().rfind("keep_", 0) == 0);
}

} // namespace

int main() {
  TestSuccessWritesOutputAndLedger();
  TestEmptySourceFailsValidation();
  TestSourceWithoutAudioFails();
  TestExtractionFailureIsRecorded();
  TestEmptyTranscriptIsSoftFailure();
  TestTranscriptionFailure();
  TestCancellationLeavesNoLedgerEntry();
  TestDetailedJsonSideCar();
  TestRelocationAvoidsCollisions();
  TestKeepTempRetainsAudio();

  std::cout << "mediascribe_unit_task_pipeline: pass\n";
  return 0;
}
