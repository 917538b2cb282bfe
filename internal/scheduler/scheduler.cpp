#include "scheduler.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/task_pipeline.hpp"
#include "internal/scheduler/worker.hpp"
#include "internal/stats/statistics_aggregator.hpp"

namespace scribe::scheduler {

using scribe::model::WorkItem;
using scribe::pipeline::TaskOutcome;

Scheduler::Scheduler(std::shared_ptr<scribe::pipeline::TaskPipeline>      pipeline,
                     std::shared_ptr<scribe::stats::StatisticsAggregator> stats, scribe::bridge::CancellationToken token,
                     ProgressCallback on_progress)
    : pipeline_(std::move(pipeline)),
      stats_(std::move(stats)),
      token_(std::move(token)),
      on_progress_(std::move(on_progress)) {
}

void Scheduler::Execute(const WorkItem& item) {
  if (token_.IsCancelled()) {
    stats_->RecordCancelled();
    return;
  }

  scribe::bridge::MonotonicProgress progress([&](double value) {
    if (on_progress_) on_progress_(item, value);
  });

  const auto report = pipeline_->Run(item, progress);

  if (report.outcome == TaskOutcome::kCancelled) {
    stats_->RecordCancelled();
    return;
  }

  scribe::stats::CompletedTask done;
  done.path            = item.path.string();
  done.success         = report.outcome == TaskOutcome::kSuccess;
  done.media_duration  = report.media_duration;
  done.processing_time = report.processing_time;
  done.error           = report.error;
  stats_->RecordCompleted(done);
}

void Scheduler::Dispatch(const WorkItem& item) {
  try {
    Execute(item);
  } catch (const std::exception& e) {
    // The pipeline converts per-file errors itself; the batch goes on regardless.
    SCRIBE_LOG_ERROR("task escaped with exception", {observability::StringField("file", item.path.string()),
                                                     observability::StringField("error", e.what())});
    scribe::stats::CompletedTask done;
    done.path  = item.path.string();
    done.error = e.what();
    stats_->RecordCompleted(done);
  }
}

scribe::model::RunStatistics Scheduler::Run(const std::vector<WorkItem>& items, unsigned concurrency) {
  if (concurrency == 0) {
    throw std::invalid_argument("concurrency must be at least 1");
  }

  SCRIBE_LOG_INFO("scheduling", {observability::IntField("items", static_cast<int64_t>(items.size())),
                                 observability::IntField("concurrency", concurrency)});

  if (concurrency == 1) {
    for (const auto& item : items) {
      Dispatch(item);
    }
    return stats_->Snapshot();
  }

  auto queue = std::make_shared<WorkQueue>();
  for (const auto& item : items) {
    queue->Enqueue(item);
  }
  queue->Shutdown();

  const size_t threads = std::min<size_t>(concurrency, std::max<size_t>(items.size(), 1));

  std::vector<std::unique_ptr<Worker>> workers;
  workers.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers.push_back(std::make_unique<Worker>(queue, [this](const WorkItem& item) { Dispatch(item); }));
    workers.back()->Start();
  }
  for (auto& worker : workers) {
    worker->Join();
  }

  return stats_->Snapshot();
}

} // namespace scribe::scheduler
