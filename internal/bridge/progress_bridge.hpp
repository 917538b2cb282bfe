#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/bridge/cancellation.hpp"
#include "internal/bridge/progress_parser.hpp"
#include "internal/bridge/progress_reporter.hpp"

namespace scribe::bridge {

struct BridgeOptions {
  // No output on either stream for this long kills the child.
  std::chrono::milliseconds stall_timeout{120000};
  // Time between SIGTERM and SIGKILL.
  std::chrono::milliseconds kill_grace{5000};
  // Hard wall-clock limit; zero disables it.
  std::chrono::milliseconds max_runtime{0};

  size_t diagnostic_lines = 20;
  size_t max_stdout_bytes = 16 * 1024 * 1024;
};

struct ProcessResult {
  int         exit_code = 0;
  std::string stdout_text;
  std::string diagnostics;  // stderr tail
  double      elapsed_seconds = 0.0;
};

/*
  Supervises one external engine process.

  Both output streams are read line by line (\n or \r terminated) and every
  line goes through the parser. Progress flows to the reporter as a fraction
  of total_duration_hint (or directly, for ratio parsers).

  Throws:
      EngineFailure   non-zero exit, signal, stall or runtime limit
      CancelledError  token set while the child ran
*/
class ProgressBridge {
 public:
  ProgressBridge(BridgeOptions options, CancellationToken token);

  ProcessResult Run(const std::vector<std::string>& argv, double total_duration_hint, ProgressParser& parser,
                    ProgressReporter& reporter) const;

 private:
  BridgeOptions     options_;
  CancellationToken token_;
};

} // namespace scribe::bridge
