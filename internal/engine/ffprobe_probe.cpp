#include "ffprobe_probe.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cstdlib>
#include <vector>

#include "internal/util/errors.hpp"

namespace scribe::engine {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

// ffprobe prints numbers as strings ("12.480000").
double NumberOrString(const Value& value) {
  if (value.kind_case() == Value::kNumberValue) return value.number_value();
  if (value.kind_case() == Value::kStringValue) {
    const auto& s   = value.string_value();
    char*       end = nullptr;
    const auto  d   = std::strtod(s.c_str(), &end);
    if (end != s.c_str()) return d;
  }
  return 0.0;
}

const Value* Field(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

} // namespace

FfprobeProbe::FfprobeProbe(std::string ffprobe_path, std::shared_ptr<scribe::bridge::ProgressBridge> bridge)
    : ffprobe_path_(std::move(ffprobe_path)), bridge_(std::move(bridge)) {
}

MediaInfo FfprobeProbe::Probe(const std::filesystem::path& input) {
  const std::vector<std::string> argv = {
      ffprobe_path_, "-v", "error", "-print_format", "json", "-show_format", "-show_streams", input.string(),
  };

  scribe::bridge::NullProgressParser parser;
  scribe::bridge::MonotonicProgress  ignored;

  auto result = bridge_->Run(argv, 0.0, parser, ignored);
  return ParseProbeJson(result.stdout_text);
}

MediaInfo FfprobeProbe::ParseProbeJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Struct root;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &root, options);
  if (!status.ok()) {
    throw util::EngineFailure("unreadable ffprobe output: " + std::string(status.message()));
  }

  MediaInfo info;
  double    stream_duration = 0.0;

  if (const Value* streams = Field(root, "streams"); streams && streams->has_list_value()) {
    for (const auto& stream : streams->list_value().values()) {
      if (!stream.has_struct_value()) continue;
      const auto& fields = stream.struct_value();

      const Value* type = Field(fields, "codec_type");
      if (!type || type->kind_case() != Value::kStringValue) continue;

      if (type->string_value() == "audio") {
        info.has_audio = true;
        if (const Value* d = Field(fields, "duration")) stream_duration = std::max(stream_duration, NumberOrString(*d));
      } else if (type->string_value() == "video") {
        info.has_video = true;
      }
    }
  }

  if (const Value* format = Field(root, "format"); format && format->has_struct_value()) {
    if (const Value* d = Field(format->struct_value(), "duration")) info.duration = NumberOrString(*d);
  }
  if (info.duration <= 0.0) {
    info.duration = stream_duration;
  }

  return info;
}

} // namespace scribe::engine
