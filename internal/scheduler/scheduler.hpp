#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "internal/bridge/cancellation.hpp"
#include "internal/model/run_statistics.hpp"
#include "internal/model/work_item.hpp"

namespace scribe::pipeline {
class TaskPipeline;
}

namespace scribe::stats {
class StatisticsAggregator;
}

namespace scribe::scheduler {

/*
  Bounded-concurrency execution of task pipelines.

  concurrency == 1 runs items strictly in order on the calling thread.
  Larger values start a pool that pulls from one FIFO in discovery order.

  On cancellation no further item is started: items still queued are counted
  as cancelled and in-flight pipelines stop at their next checkpoint. Run
  returns only after every worker has joined.
*/
class Scheduler {
 public:
  // Per-task progress, already monotone and clamped.
  using ProgressCallback = std::function<void(const scribe::model::WorkItem&, double)>;

  Scheduler(std::shared_ptr<scribe::pipeline::TaskPipeline> pipeline,
            std::shared_ptr<scribe::stats::StatisticsAggregator> stats, scribe::bridge::CancellationToken token,
            ProgressCallback on_progress = {});

  // Throws std::invalid_argument when concurrency is 0.
  scribe::model::RunStatistics Run(const std::vector<scribe::model::WorkItem>& items, unsigned concurrency);

 private:
  // Runs one item; an escaping exception is logged and counted as a failure.
  void Dispatch(const scribe::model::WorkItem& item);
  void Execute(const scribe::model::WorkItem& item);

  std::shared_ptr<scribe::pipeline::TaskPipeline>      pipeline_;
  std::shared_ptr<scribe::stats::StatisticsAggregator> stats_;
  scribe::bridge::CancellationToken                    token_;
  ProgressCallback                                     on_progress_;
};

} // namespace scribe::scheduler
