#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/bridge/cancellation.hpp"
#include "internal/engine/engines.hpp"
#include "internal/pipeline/task_pipeline.hpp"

namespace scribe::factory {

/*
  External engines used by one run. Tests build this by hand with fakes.
*/
struct Engines {
  std::shared_ptr<scribe::engine::MediaProbe>          probe;
  std::shared_ptr<scribe::engine::AudioExtractor>      extractor;
  std::shared_ptr<scribe::engine::TranscriptionEngine> transcriber;
};

/*
  Composition root: the only place that knows the concrete engine types.
  Every engine shares the run's cancellation token.
*/
Engines BuildEngines(const scribe::runtime::config::RuntimeConfig& config,
                     const scribe::bridge::CancellationToken&      token);

scribe::pipeline::PipelineOptions BuildPipelineOptions(const scribe::runtime::config::RuntimeConfig& config);

} // namespace scribe::factory
