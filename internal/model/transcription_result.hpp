#pragma once

#include <string>
#include <vector>

namespace scribe::model {

struct TimedSegment {
  double      start = 0.0;
  double      end   = 0.0;
  std::string text;

  // Per-token confidence in [0, 1]; empty when the engine reports none.
  std::vector<double> confidence;
};

struct TranscriptionResult {
  std::string               text;
  std::vector<TimedSegment> segments;
  std::string               language;
  double                    duration        = 0.0;
  double                    processing_time = 0.0;
  std::string               model_used;
};

} // namespace scribe::model
