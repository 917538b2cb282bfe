#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/bridge/cancellation.hpp"
#include "internal/factory.hpp"
#include "internal/model/run_statistics.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/stats/statistics_aggregator.hpp"

namespace scribe::ledger {
class Ledger;
}

namespace scribe::runtime {

struct BatchResult {
  scribe::model::RunStatistics           stats;
  std::vector<scribe::stats::FailedFile> failures;
  double                                 wall_seconds = 0.0;
  bool                                   interrupted  = false;
};

/*
  One complete run over the input directory:

      validate setup → discover → skip processed → schedule → sweep temp

  Setup problems throw SetupError before anything is scheduled. Per-file
  failures never escape; they end up in the ledger and in BatchResult.
*/
class BatchRunner {
 public:
  BatchRunner(scribe::runtime::config::RuntimeConfig config, scribe::factory::Engines engines,
              scribe::bridge::CancellationToken token);
  ~BatchRunner();

  // Problems that make a run pointless; empty when ready.
  std::vector<std::string> ValidateSetup() const;

  BatchResult Run(scribe::scheduler::Scheduler::ProgressCallback on_progress = {});

  // Deletes stale *.wav files in <temp_dir>/audio, newest keep_recent kept.
  size_t SweepTemp(size_t keep_recent) const;

  void PrintSummary(std::ostream& out, const BatchResult& result) const;

  // Discovered files per extension plus cross-run ledger statistics.
  void PrintInventory(std::ostream& out);

  const scribe::ledger::Ledger& ledger() const {
    return *ledger_;
  }

 private:
  scribe::runtime::config::RuntimeConfig config_;
  scribe::factory::Engines               engines_;
  scribe::bridge::CancellationToken      token_;
  std::shared_ptr<scribe::ledger::Ledger> ledger_;
};

/*
  Engine binaries and model file that cannot be found. Looks up bare names
  on PATH.
*/
std::vector<std::string> CheckEngineBinaries(const scribe::runtime::config::RuntimeConfig& config);

} // namespace scribe::runtime
