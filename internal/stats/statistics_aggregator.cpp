#include "statistics_aggregator.hpp"

namespace scribe::stats {

void StatisticsAggregator::RecordDiscovered(uint64_t count) {
  std::lock_guard lock(mutex_);
  stats_.total_discovered += count;
}

void StatisticsAggregator::RecordCompleted(const CompletedTask& task) {
  std::lock_guard lock(mutex_);
  stats_.processed++;

  if (task.success) {
    stats_.successful++;
    stats_.total_duration += task.media_duration;
    stats_.total_processing_time += task.processing_time;
  } else {
    stats_.failed++;
    failures_.push_back({task.path, task.error});
  }
}

void StatisticsAggregator::RecordSkipped(uint64_t count) {
  std::lock_guard lock(mutex_);
  stats_.skipped += count;
}

void StatisticsAggregator::RecordCancelled(uint64_t count) {
  std::lock_guard lock(mutex_);
  stats_.cancelled += count;
}

scribe::model::RunStatistics StatisticsAggregator::Snapshot() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

std::vector<FailedFile> StatisticsAggregator::Failures() const {
  std::lock_guard lock(mutex_);
  return failures_;
}

} // namespace scribe::stats
