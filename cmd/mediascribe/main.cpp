#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/batch_runner.hpp"
#include "internal/runtime/signal_watcher.hpp"
#include "internal/util/errors.hpp"

using scribe::config::ConfigLoader;
using scribe::runtime::BatchRunner;
using scribe::runtime::SignalWatcher;
using scribe::runtime::config::RuntimeConfig;

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitInterrupted = 1;
constexpr int kExitFatal       = 2;
constexpr int kExitUsage       = 64;

struct Options {
  std::optional<std::string> config_path;
  std::optional<std::string> input;
  std::optional<std::string> output;
  std::optional<unsigned>    workers;
  std::optional<std::string> format;
  std::optional<std::string> language;
  std::optional<std::string> model;
  std::optional<std::string> model_path;
  std::optional<std::string> relocate;

  bool skip_existing = false;
  bool no_cleanup    = false;
  bool timestamps    = false;
  bool detailed_json = false;
  bool summary       = false;
  bool quiet         = false;
  bool verbose       = false;
};

void Usage(std::ostream& out) {
  out << "Usage: mediascribe -i <input_dir> -o <output_dir> [options]\n"
      << "\n"
      << "  -i, --input <dir>        directory with media files\n"
      << "  -o, --output <dir>       directory for transcripts\n"
      << "  -c, --config <file>      YAML configuration\n"
      << "  -w, --workers <n>        parallel files (default 1)\n"
      << "  -s, --skip-existing      skip files already transcribed\n"
      << "  -f, --format <fmt>       txt | srt | vtt | json (default txt)\n"
      << "  -l, --language <code>    language hint (default auto)\n"
      << "  -m, --model <name>       model identifier (default medium)\n"
      << "      --model-path <file>  whisper model file\n"
      << "      --relocate <dir>     move sources here after success\n"
      << "      --no-cleanup         keep temporary audio\n"
      << "      --timestamps         timestamps in text output\n"
      << "      --detailed-json      also write a .json transcript\n"
      << "      --summary            show input inventory and history, then exit\n"
      << "  -q, --quiet              minimal output\n"
      << "  -v, --verbose            debug logging\n"
      << "  -h, --help\n";
}

// Returns nullopt after printing an error.
std::optional<Options> ParseArgs(int argc, char** argv) {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "mediascribe: " << arg << " requires a value\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    std::optional<std::string>* target = nullptr;
    if (arg == "-i" || arg == "--input") target = &opts.input;
    else if (arg == "-o" || arg == "--output") target = &opts.output;
    else if (arg == "-c" || arg == "--config") target = &opts.config_path;
    else if (arg == "-f" || arg == "--format") target = &opts.format;
    else if (arg == "-l" || arg == "--language") target = &opts.language;
    else if (arg == "-m" || arg == "--model") target = &opts.model;
    else if (arg == "--model-path") target = &opts.model_path;
    else if (arg == "--relocate") target = &opts.relocate;

    if (target) {
      auto v = value();
      if (!v) return std::nullopt;
      *target = std::move(*v);
      continue;
    }

    if (arg == "-w" || arg == "--workers") {
      auto v = value();
      if (!v) return std::nullopt;
      char*      end = nullptr;
      const long n   = std::strtol(v->c_str(), &end, 10);
      if (v->empty() || *end != '\0' || n < 1) {
        std::cerr << "mediascribe: --workers must be a positive integer\n";
        return std::nullopt;
      }
      opts.workers = static_cast<unsigned>(n);
    } else if (arg == "-s" || arg == "--skip-existing") {
      opts.skip_existing = true;
    } else if (arg == "--no-cleanup") {
      opts.no_cleanup = true;
    } else if (arg == "--timestamps") {
      opts.timestamps = true;
    } else if (arg == "--detailed-json") {
      opts.detailed_json = true;
    } else if (arg == "--summary") {
      opts.summary = true;
    } else if (arg == "-q" || arg == "--quiet") {
      opts.quiet = true;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      Usage(std::cout);
      std::exit(kExitOk);
    } else {
      std::cerr << "mediascribe: unknown option " << arg << "\n";
      return std::nullopt;
    }
  }
  return opts;
}

// Command-line flags win over the configuration file.
void ApplyOverrides(const Options& opts, RuntimeConfig* config) {
  auto* processing = config->mutable_processing();
  if (opts.input) processing->set_input_dir(*opts.input);
  if (opts.output) processing->set_output_dir(*opts.output);
  if (opts.workers) processing->set_max_workers(*opts.workers);
  if (opts.format) processing->set_output_format(*opts.format);
  if (opts.language) processing->set_language(*opts.language);
  if (opts.model) processing->set_model_name(*opts.model);
  if (opts.relocate) processing->set_relocate_dir(*opts.relocate);
  if (opts.skip_existing) processing->set_skip_existing(true);
  if (opts.no_cleanup) processing->set_cleanup_temp(false);
  if (opts.timestamps) processing->set_include_timestamps(true);
  if (opts.detailed_json) processing->set_save_detailed_json(true);
  if (opts.quiet) processing->set_quiet(true);

  if (opts.model_path) config->mutable_engines()->set_whisper_model_path(*opts.model_path);
  if (opts.verbose) config->mutable_logging()->set_level("debug");

  ConfigLoader::ApplyDefaults(config);
}

void Shutdown() {
  scribe::observability::ShutdownMetrics();
  scribe::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  // Before any thread exists, so every thread inherits the mask.
  SignalWatcher::Block();

  const auto opts = ParseArgs(argc, argv);
  if (!opts) {
    Usage(std::cerr);
    return kExitUsage;
  }
  if (!opts->summary && !opts->config_path && (!opts->input || !opts->output)) {
    std::cerr << "mediascribe: input (-i) and output (-o) directories are required\n";
    Usage(std::cerr);
    return kExitUsage;
  }

  RuntimeConfig config;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (opts->config_path) {
      config = ConfigLoader::LoadFromYaml(*opts->config_path);
    }
    ApplyOverrides(*opts, &config);
  } catch (const std::exception& e) {
    std::cerr << "mediascribe: " << e.what() << "\n";
    return kExitFatal;
  }

  scribe::observability::InitializeLogging(config);
  scribe::observability::InitializeMetrics(config);

  scribe::bridge::CancellationToken token;
  int                               exit_code = kExitOk;

  try {
    if (opts->summary) {
      BatchRunner runner(config, {}, token);
      runner.PrintInventory(std::cout);
      Shutdown();
      return kExitOk;
    }

    const auto missing = scribe::runtime::CheckEngineBinaries(config);
    if (!missing.empty()) {
      for (const auto& problem : missing) {
        SCRIBE_LOG_ERROR("setup check failed", {scribe::observability::StringField("problem", problem)});
      }
      Shutdown();
      return kExitFatal;
    }

    // ------------------------------------------------------------
    // Build and run
    // ------------------------------------------------------------
    SignalWatcher watcher(token);
    watcher.Start();

    BatchRunner runner(config, scribe::factory::BuildEngines(config, token), token);
    SCRIBE_LOG_INFO("mediascribe started",
                    {scribe::observability::StringField("input", config.processing().input_dir()),
                     scribe::observability::StringField("output", config.processing().output_dir()),
                     scribe::observability::StringField("format", config.processing().output_format()),
                     scribe::observability::IntField("workers", config.processing().max_workers())});

    const auto result = runner.Run([](const scribe::model::WorkItem& item, double progress) {
      SCRIBE_LOG_DEBUG("progress", {scribe::observability::StringField("file", item.path.filename().string()),
                                    scribe::observability::DoubleField("fraction", progress)});
    });

    watcher.Stop();

    if (!config.processing().quiet()) {
      runner.PrintSummary(std::cout, result);
    }
    // Per-file failures are in the ledger and the summary; they do not fail the run.
    if (result.interrupted) {
      exit_code = kExitInterrupted;
    }
  } catch (const scribe::util::SetupError& e) {
    SCRIBE_LOG_ERROR("setup validation failed", {scribe::observability::StringField("error", e.what())});
    exit_code = kExitFatal;
  } catch (const std::exception& e) {
    SCRIBE_LOG_ERROR("Fatal error", {scribe::observability::StringField("error", e.what())});
    exit_code = kExitFatal;
  }

  Shutdown();
  return exit_code;
}
