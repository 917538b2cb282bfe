#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "internal/output/output_format.hpp"

namespace scribe::config {

namespace {

constexpr uint32_t kDefaultSampleRate     = 16000;
constexpr uint32_t kDefaultChannels       = 1;
constexpr uint64_t kDefaultStallTimeoutMs = 120000;
constexpr uint64_t kDefaultKillGraceMs    = 5000;
constexpr uint64_t kDefaultProbeTimeoutMs = 30000;
constexpr uint32_t kDefaultKeepRecentTemp = 5;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

scribe::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  scribe::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

std::string ConfigLoader::LedgerPath(const scribe::runtime::config::RuntimeConfig& config) {
  const auto& processing = config.processing();
  if (!processing.ledger_path().empty()) return processing.ledger_path();
  return (std::filesystem::path(processing.output_dir()) / ".processing_history.json").string();
}

std::vector<std::string> ConfigLoader::DefaultSupportedFormats() {
  return {".mp4", ".avi", ".mov", ".mkv", ".flv", ".webm", ".m4v", ".wmv", ".3gp", ".ogv"};
}

void ConfigLoader::ApplyDefaults(scribe::runtime::config::RuntimeConfig* config) {
  auto* processing = config->mutable_processing();
  if (!processing->has_recursive()) processing->set_recursive(true);
  if (!processing->has_cleanup_temp()) processing->set_cleanup_temp(true);
  if (processing->max_workers() == 0) processing->set_max_workers(1);
  if (!processing->has_keep_recent_temp()) processing->set_keep_recent_temp(kDefaultKeepRecentTemp);
  if (processing->output_format().empty()) processing->set_output_format("txt");
  if (processing->language().empty()) processing->set_language("auto");
  if (processing->model_name().empty()) processing->set_model_name("medium");
  if (processing->temp_dir().empty()) {
    processing->set_temp_dir((std::filesystem::temp_directory_path() / "mediascribe").string());
  }
  if (processing->supported_formats_size() == 0) {
    for (const auto& ext : DefaultSupportedFormats()) processing->add_supported_formats(ext);
  }

  auto* audio = config->mutable_audio();
  if (audio->sample_rate() == 0) audio->set_sample_rate(kDefaultSampleRate);
  if (audio->channels() == 0) audio->set_channels(kDefaultChannels);

  auto* engines = config->mutable_engines();
  if (engines->ffmpeg_path().empty()) engines->set_ffmpeg_path("ffmpeg");
  if (engines->ffprobe_path().empty()) engines->set_ffprobe_path("ffprobe");
  if (engines->whisper_path().empty()) engines->set_whisper_path("whisper-cli");
  if (!engines->has_stall_timeout_ms()) engines->set_stall_timeout_ms(kDefaultStallTimeoutMs);
  if (engines->kill_grace_ms() == 0) engines->set_kill_grace_ms(kDefaultKillGraceMs);
  if (engines->probe_timeout_ms() == 0) engines->set_probe_timeout_ms(kDefaultProbeTimeoutMs);
}

std::vector<std::string> ConfigLoader::Validate(const scribe::runtime::config::RuntimeConfig& config) {
  std::vector<std::string> problems;

  const auto& processing = config.processing();
  if (processing.input_dir().empty()) {
    problems.emplace_back("processing.input_dir is required");
  }
  if (processing.output_dir().empty()) {
    problems.emplace_back("processing.output_dir is required");
  }
  if (processing.max_workers() < 1) {
    problems.emplace_back("processing.max_workers must be at least 1");
  }
  if (!scribe::output::ParseOutputFormat(processing.output_format())) {
    problems.emplace_back("processing.output_format must be one of txt, srt, vtt, json (got '" + processing.output_format() + "')");
  }
  for (const auto& ext : processing.supported_formats()) {
    if (ext.size() < 2 || ext.front() != '.') {
      problems.emplace_back("processing.supported_formats entries must start with '.' (got '" + ext + "')");
    }
  }

  const auto& audio = config.audio();
  if (audio.sample_rate() == 0) {
    problems.emplace_back("audio.sample_rate must be positive");
  }
  if (audio.channels() < 1 || audio.channels() > 2) {
    problems.emplace_back("audio.channels must be 1 or 2");
  }

  const auto& engines = config.engines();
  if (engines.whisper_model_path().empty()) {
    problems.emplace_back("engines.whisper_model_path is required");
  }
  if (engines.kill_grace_ms() == 0) {
    problems.emplace_back("engines.kill_grace_ms must be positive");
  }

  return problems;
}

} // namespace scribe::config
