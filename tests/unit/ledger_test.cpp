#include "internal/ledger/ledger.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using scribe::ledger::Ledger;
using scribe::testing::TempDir;
using scribe::testing::WriteFile;
using scribe::v1::LedgerEntry;

LedgerEntry MakeEntry(const std::string& source, bool success, double duration = 10.0) {
  LedgerEntry entry;
  entry.set_source_path(source);
  entry.set_processed_at("2024-05-01T13:45:10");
  entry.set_duration(duration);
  entry.set_processing_time(2.0);
  entry.set_model_used("medium");
  entry.set_success(success);
  if (!success) {
    entry.set_error("boom");
    entry.set_error_kind("ExtractionError");
  }
  return entry;
}

void TestMissingFileIsEmpty() {
  TempDir dir("ledger_missing");
  Ledger  ledger(dir.path() / "history.json");
  ledger.Load();
  assert(ledger.Size() == 0);
  assert(ledger.Stats().total_processed() == 0);
}

void TestRecordPersistsAndReloads() {
  TempDir dir("ledger_reload");
  const auto path = dir.path() / "history.json";

  {
    Ledger ledger(path);
    ledger.Load();
    ledger.Record("id-a", MakeEntry("/in/a.mp4", true));
    ledger.Record("id-b", MakeEntry("/in/b.mp4", false));
  }

  const auto json = scribe::testing::ReadFile(path);
  assert(json.find("\"processed_files\"") != std::string::npos);
  assert(json.find("\"statistics\"") != std::string::npos);

  Ledger reloaded(path);
  reloaded.Load();
  assert(reloaded.Size() == 2);
  assert(reloaded.Get("id-a")->success());
  assert(!reloaded.Get("id-b")->success());
  assert(!reloaded.Get("id-c"));

  const auto stats = reloaded.Stats();
  assert(stats.total_processed() == 2);
  assert(stats.successful() == 1);
  assert(stats.failed() == 1);

  const auto failed = reloaded.FailedEntries();
  assert(failed.size() == 1);
  assert(failed.front().source_path() == "/in/b.mp4");
}

void TestNewerAttemptReplacesEntry() {
  TempDir dir("ledger_replace");
  Ledger  ledger(dir.path() / "history.json");
  ledger.Load();

  ledger.Record("id", MakeEntry("/in/a.mp4", false));
  ledger.Record("id", MakeEntry("/in/a.mp4", true));

  assert(ledger.Size() == 1);
  assert(ledger.Get("id")->success());
  // Aggregates count attempts, not files.
  assert(ledger.Stats().total_processed() == 2);
}

void TestShouldSkipRequiresSuccessAndNonEmptyOutput() {
  TempDir dir("ledger_skip");
  Ledger  ledger(dir.path() / "history.json");
  ledger.Load();

  const auto output = dir.path() / "out" / "a.txt";
  ledger.Record("ok", MakeEntry("/in/a.mp4", true));
  ledger.Record("bad", MakeEntry("/in/b.mp4", false));

  assert(!ledger.ShouldSkip("ok", output));  // output missing

  WriteFile(output, "");
  assert(!ledger.ShouldSkip("ok", output));  // output empty

  WriteFile(output, "text\n");
  assert(ledger.ShouldSkip("ok", output));
  assert(!ledger.ShouldSkip("bad", output));
  assert(!ledger.ShouldSkip("unknown", output));
}

void TestCorruptFileTreatedAsEmpty() {
  TempDir dir("ledger_corrupt");
  const auto path = dir.path() / "history.json";
  WriteFile(path, "{ this is not json");

  Ledger ledger(path);
  ledger.Load();
  assert(ledger.Size() == 0);

  ledger.Record("id", MakeEntry("/in/a.mp4", true));
  Ledger reloaded(path);
  reloaded.Load();
  assert(reloaded.Size() == 1);
}

void TestUnknownFieldsAreIgnored() {
  TempDir dir("ledger_unknown");
  const auto path = dir.path() / "history.json";
  WriteFile(path, R"({
  "processed_files": {
    "id": {"source_path": "/in/a.mp4", "success": true, "future_field": 7}
  },
  "statistics": {"total_processed": 1, "successful": 1},
  "schema_version": 3
})");

  Ledger ledger(path);
  ledger.Load();
  assert(ledger.Size() == 1);
  assert(ledger.Get("id")->source_path() == "/in/a.mp4");
  assert(ledger.Stats().successful() == 1);
}

void TestConcurrentRecordsAreAllPersisted() {
  TempDir dir("ledger_concurrent");
  const auto path = dir.path() / "history.json";

  Ledger ledger(path);
  ledger.Load();

  constexpr int kThreads   = 4;
  constexpr int kPerThread = 10;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const auto id = "id-" + std::to_string(t) + "-" + std::to_string(i);
        ledger.Record(id, MakeEntry("/in/" + id + ".mp4", true));
        (void)ledger.ShouldSkip(id, path);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  Ledger reloaded(path);
  reloaded.Load();
  assert(reloaded.Size() == kThreads * kPerThread);
  assert(reloaded.Stats().total_processed() == kThreads * kPerThread);
}

void TestUnwritableLocationThrowsPersistenceError() {
  TempDir dir("ledger_unwritable");
  const auto blocker = dir.path() / "file";
  WriteFile(blocker, "x");

  // Parent "directory" is a regular file.
  Ledger ledger(blocker / "history.json");
  ledger.Load();

  bool threw = false;
  try {
    ledger.Record("id", MakeEntry("/in/a.mp4", true));
  } catch (const scribe::util::PersistenceError&) {
    threw = true;
  }
  assert(threw && "Record must surface persistence failures.");
}

void TestFailedWriteLeavesNoTrace() {
  TempDir    dir("ledger_failed_write");
  const auto path = dir.path() / "history.json";

  // A directory in place of the document makes the final rename fail.
  fs::create_directories(path / "occupied");

  Ledger ledger(path);
  bool   threw = false;
  try {
    ledger.Record("id-a", MakeEntry("/in/a.mp4", true));
  } catch (const scribe::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Size() == 0);
  assert(!ledger.Get("id-a").has_value());
  assert(ledger.Stats().total_processed() == 0);

  // The next successful write must not carry the failed attempt along.
  fs::remove_all(path);
  ledger.Record("id-b", MakeEntry("/in/b.mp4", false));

  Ledger reloaded(path);
  reloaded.Load();
  assert(reloaded.Size() == 1);
  assert(!reloaded.Get("id-a").has_value());
  assert(reloaded.Stats().total_processed() == 1);
  assert(reloaded.Stats().successful() == 0);
  assert(reloaded.Stats().failed() == 1);
}

} // namespace

int main() {
  TestMissingFileIsEmpty();
  TestRecordPersistsAndReloads();
  TestNewerAttemptReplacesEntry();
  TestShouldSkipRequiresSuccessAndNonEmptyOutput();
  TestCorruptFileTreatedAsEmpty();
  TestUnknownFieldsAreIgnored();
  TestConcurrentRecordsAreAllPersisted();
  TestUnwritableLocationThrowsPersistenceError();
  TestFailedWriteLeavesNoTrace();

  std::cout << "mediascribe_unit_ledger: pass\n";
  return 0;
}
