#include "output_format.hpp"

#include "internal/util/path_utils.hpp"

namespace scribe::output {

std::optional<OutputFormat> ParseOutputFormat(std::string_view name) {
  const auto lowered = scribe::util::ToLower(name);
  if (lowered == "txt" || lowered == "text") return OutputFormat::kText;
  if (lowered == "srt") return OutputFormat::kSubtitle;
  if (lowered == "vtt") return OutputFormat::kWebSubtitle;
  if (lowered == "json") return OutputFormat::kStructured;
  return std::nullopt;
}

std::string_view Extension(OutputFormat format) {
  switch (format) {
    case OutputFormat::kText:
      return ".txt";
    case OutputFormat::kSubtitle:
      return ".srt";
    case OutputFormat::kWebSubtitle:
      return ".vtt";
    case OutputFormat::kStructured:
      return ".json";
  }
  return ".txt";
}

} // namespace scribe::output
