#pragma once

#include <algorithm>
#include <cmath>
#include <functional>
#include <utility>

namespace scribe::bridge {

class ProgressReporter {
 public:
  virtual ~ProgressReporter() = default;

  // fraction in [0, 1]; values outside are clamped.
  virtual void Report(double fraction) = 0;
};

inline double ClampFraction(double fraction) {
  if (std::isnan(fraction)) return 0.0;
  return std::clamp(fraction, 0.0, 1.0);
}

/*
  Top-level reporter for one task. Never goes backwards: a value below the
  last reported one is dropped. The sink only sees increases.
*/
class MonotonicProgress final : public ProgressReporter {
 public:
  using Sink = std::function<void(double)>;

  explicit MonotonicProgress(Sink sink = {}) : sink_(std::move(sink)) {
  }

  void Report(double fraction) override {
    fraction = ClampFraction(fraction);
    if (fraction <= value_) return;
    value_ = fraction;
    if (sink_) sink_(value_);
  }

  double value() const {
    return value_;
  }

 private:
  Sink   sink_;
  double value_ = 0.0;
};

/*
  Maps a stage's own [0, 1] onto [offset, offset + weight] of its parent.
*/
class ProgressRange final : public ProgressReporter {
 public:
  ProgressRange(ProgressReporter& parent, double offset, double weight)
      : parent_(parent), offset_(offset), weight_(weight) {
  }

  void Report(double fraction) override {
    parent_.Report(offset_ + weight_ * ClampFraction(fraction));
  }

 private:
  ProgressReporter& parent_;
  double            offset_;
  double            weight_;
};

} // namespace scribe::bridge
