#include "serializer.hpp"

#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <sstream>
#include <stdexcept>

#include "internal/output/timestamp.hpp"

namespace scribe::output {

using scribe::model::TranscriptionResult;

std::string Trim(std::string_view value) {
  size_t begin = 0;
  size_t end   = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
  return std::string(value.substr(begin, end - begin));
}

size_t CountWords(std::string_view text) {
  size_t words   = 0;
  bool   in_word = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return words;
}

// ------------------------------------------------------------
// Text
// ------------------------------------------------------------

std::string TextSerializer::Render(const TranscriptionResult& result) const {
  std::ostringstream out;

  if (include_timestamps_ && !result.segments.empty()) {
    for (const auto& segment : result.segments) {
      out << '[' << FormatClock(segment.start) << " --> " << FormatClock(segment.end) << "] " << Trim(segment.text) << '\n';
    }
    return out.str();
  }

  out << result.text;
  if (!result.text.empty() && result.text.back() != '\n') {
    out << '\n';
  }
  return out.str();
}

// ------------------------------------------------------------
// Subtitles
// ------------------------------------------------------------

std::string SubtitleSerializer::Render(const TranscriptionResult& result) const {
  std::ostringstream out;

  size_t cue = 1;
  for (const auto& segment : result.segments) {
    out << cue++ << '\n';
    out << FormatSubtitleTimestamp(segment.start) << " --> " << FormatSubtitleTimestamp(segment.end) << '\n';
    out << Trim(segment.text) << "\n\n";
  }
  return out.str();
}

std::string WebSubtitleSerializer::Render(const TranscriptionResult& result) const {
  std::ostringstream out;
  out << "WEBVTT\n\n";

  for (const auto& segment : result.segments) {
    out << FormatWebSubtitleTimestamp(segment.start) << " --> " << FormatWebSubtitleTimestamp(segment.end) << '\n';
    out << Trim(segment.text) << "\n\n";
  }
  return out.str();
}

// ------------------------------------------------------------
// Structured
// ------------------------------------------------------------

scribe::v1::TranscriptDocument ToDocument(const TranscriptionResult& result) {
  scribe::v1::TranscriptDocument doc;
  doc.set_text(result.text);
  doc.set_language(result.language);
  doc.set_duration(result.duration);
  doc.set_processing_time(result.processing_time);
  doc.set_model_used(result.model_used);

  double   confidence_sum = 0.0;
  uint32_t words          = 0;
  uint32_t id             = 0;

  for (const auto& segment : result.segments) {
    auto* out = doc.add_segments();
    out->set_id(id++);
    out->set_start(segment.start);
    out->set_end(segment.end);
    out->set_text(segment.text);
    for (double c : segment.confidence) {
      out->add_confidence(c);
      doc.add_confidence_scores(c);
      confidence_sum += c;
    }
    words += static_cast<uint32_t>(CountWords(segment.text));
  }
  if (result.segments.empty()) {
    words = static_cast<uint32_t>(CountWords(result.text));
  }

  auto* metadata = doc.mutable_metadata();
  metadata->set_average_confidence(doc.confidence_scores_size() > 0 ? confidence_sum / doc.confidence_scores_size() : 0.0);
  metadata->set_total_segments(static_cast<uint32_t>(result.segments.size()));
  metadata->set_total_words(words);
  return doc;
}

std::string StructuredSerializer::Render(const TranscriptionResult& result) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToDocument(result), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render transcript json: " + std::string(status.message()));
  }
  return json;
}

std::unique_ptr<OutputSerializer> MakeSerializer(OutputFormat format, bool include_timestamps) {
  switch (format) {
    case OutputFormat::kText:
      return std::make_unique<TextSerializer>(include_timestamps);
    case OutputFormat::kSubtitle:
      return std::make_unique<SubtitleSerializer>();
    case OutputFormat::kWebSubtitle:
      return std::make_unique<WebSubtitleSerializer>();
    case OutputFormat::kStructured:
      return std::make_unique<StructuredSerializer>();
  }
  throw std::invalid_argument("unknown output format");
}

} // namespace scribe::output
