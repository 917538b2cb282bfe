#pragma once

#include <cstdint>

namespace scribe::model {

struct RunStatistics {
  uint64_t total_discovered = 0;
  uint64_t processed        = 0;
  uint64_t successful       = 0;
  uint64_t failed           = 0;
  uint64_t skipped          = 0;
  uint64_t cancelled        = 0;

  double total_duration        = 0.0;
  double total_processing_time = 0.0;

  // processing time / media duration; 0 when no media time was recorded.
  double RealtimeFactor() const {
    return total_duration > 0.0 ? total_processing_time / total_duration : 0.0;
  }

  double SuccessRate() const {
    return processed > 0 ? static_cast<double>(successful) / static_cast<double>(processed) : 0.0;
  }

  double AverageSecondsPerFile() const {
    return successful > 0 ? total_processing_time / static_cast<double>(successful) : 0.0;
  }
};

} // namespace scribe::model
