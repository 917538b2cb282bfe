#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "internal/model/run_statistics.hpp"

namespace scribe::stats {

struct CompletedTask {
  std::string path;
  bool        success         = false;
  double      media_duration  = 0.0;
  double      processing_time = 0.0;
  std::string error;
};

struct FailedFile {
  std::string path;
  std::string error;
};

/*
  Run-level counters. Safe to call from every worker.
*/
class StatisticsAggregator {
 public:
  void RecordDiscovered(uint64_t count);
  void RecordCompleted(const CompletedTask& task);
  void RecordSkipped(uint64_t count = 1);
  void RecordCancelled(uint64_t count = 1);

  scribe::model::RunStatistics Snapshot() const;
  std::vector<FailedFile>      Failures() const;

 private:
  mutable std::mutex           mutex_;
  scribe::model::RunStatistics stats_;
  std::vector<FailedFile>      failures_;
};

} // namespace scribe::stats
