#include "whisper_cli_engine.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace scribe::engine {

namespace fs = std::filesystem;

using google::protobuf::Struct;
using google::protobuf::Value;
using scribe::model::TimedSegment;
using scribe::model::TranscriptionResult;

namespace {

const Value* Field(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

const Struct* StructField(const Struct& s, const std::string& key) {
  const Value* v = Field(s, key);
  return (v && v->has_struct_value()) ? &v->struct_value() : nullptr;
}

std::string StringField(const Struct& s, const std::string& key) {
  const Value* v = Field(s, key);
  return (v && v->kind_case() == Value::kStringValue) ? v->string_value() : std::string();
}

double NumberField(const Struct& s, const std::string& key, double fallback = 0.0) {
  const Value* v = Field(s, key);
  return (v && v->kind_case() == Value::kNumberValue) ? v->number_value() : fallback;
}

// Control tokens such as [_BEG_] or [_TT_150] carry no text.
bool IsControlToken(const std::string& text) {
  return text.rfind("[_", 0) == 0;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::TranscriptionError("transcription output missing: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace

WhisperCliEngine::WhisperCliEngine(WhisperOptions options, std::shared_ptr<scribe::bridge::ProgressBridge> bridge)
    : options_(std::move(options)), bridge_(std::move(bridge)) {
}

std::vector<std::string> WhisperCliEngine::BuildCommand(const fs::path& audio, const fs::path& output_prefix,
                                                        const std::string& language_hint) const {
  std::vector<std::string> argv = {options_.whisper_path, "-m", options_.model_path, "-f", audio.string()};

  argv.insert(argv.end(), {"-l", language_hint.empty() ? std::string("auto") : language_hint});
  if (options_.threads > 0) {
    argv.insert(argv.end(), {"-t", std::to_string(options_.threads)});
  }

  // Progress on stderr, full JSON (segments plus token probabilities) on disk.
  argv.insert(argv.end(), {"-pp", "-ojf", "-of", output_prefix.string()});
  return argv;
}

TranscriptionResult WhisperCliEngine::Transcribe(const fs::path& audio, const std::string& language_hint,
                                                 double duration_hint, scribe::bridge::ProgressReporter& progress) {
  fs::path prefix = audio;
  prefix.replace_extension();
  fs::path json_path = prefix;
  json_path += ".json";

  scribe::bridge::WhisperProgressParser parser;
  scribe::bridge::ProcessResult         process;

  std::error_code ec;
  try {
    process = bridge_->Run(BuildCommand(audio, prefix, language_hint), duration_hint, parser, progress);
  } catch (const util::CancelledError&) {
    fs::remove(json_path, ec);
    throw;
  } catch (const util::EngineFailure& e) {
    fs::remove(json_path, ec);
    throw util::TranscriptionError(std::string("transcription failed: ") + e.what(), e.diagnostics());
  }

  const std::string json = ReadFile(json_path);
  fs::remove(json_path, ec);

  auto result            = ParseResultJson(json, language_hint);
  result.processing_time = process.elapsed_seconds;
  result.model_used      = options_.model_name;

  observability::Metrics::Instance().ObserveEngineDurationMs("whisper", process.elapsed_seconds * 1000.0);
  progress.Report(1.0);

  SCRIBE_LOG_DEBUG("transcription finished",
                   {observability::StringField("audio", audio.string()),
                    observability::StringField("language", result.language),
                    observability::IntField("segments", static_cast<int64_t>(result.segments.size()))});
  return result;
}

TranscriptionResult WhisperCliEngine::ParseResultJson(const std::string& json, const std::string& language_hint) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Struct root;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &root, options);
  if (!status.ok()) {
    throw util::TranscriptionError("unreadable transcription output: " + std::string(status.message()));
  }

  TranscriptionResult result;
  result.language = language_hint;
  if (const Struct* r = StructField(root, "result")) {
    const auto detected = StringField(*r, "language");
    if (!detected.empty()) result.language = detected;
  }

  const Value* transcription = Field(root, "transcription");
  if (transcription && transcription->has_list_value()) {
    for (const auto& item : transcription->list_value().values()) {
      if (!item.has_struct_value()) continue;
      const auto& fields = item.struct_value();

      TimedSegment segment;
      segment.text = StringField(fields, "text");
      if (const Struct* offsets = StructField(fields, "offsets")) {
        segment.start = NumberField(*offsets, "from") / 1000.0;
        segment.end   = NumberField(*offsets, "to") / 1000.0;
      }

      const Value* tokens = Field(fields, "tokens");
      if (tokens && tokens->has_list_value()) {
        for (const auto& token : tokens->list_value().values()) {
          if (!token.has_struct_value()) continue;
          const auto& t = token.struct_value();
          if (IsControlToken(StringField(t, "text"))) continue;
          if (Field(t, "p")) segment.confidence.push_back(NumberField(t, "p"));
        }
      }

      result.text += segment.text;
      result.segments.push_back(std::move(segment));
    }
  }

  // Segment texts carry their own leading space.
  const auto first = result.text.find_first_not_of(" \t\n");
  result.text      = first == std::string::npos ? std::string() : result.text.substr(first);

  if (!result.segments.empty()) {
    result.duration = result.segments.back().end;
  }
  return result;
}

} // namespace scribe::engine
