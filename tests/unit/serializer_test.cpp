#include "internal/output/serializer.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <string>

namespace {

using scribe::model::TranscriptionResult;
using scribe::output::MakeSerializer;
using scribe::output::OutputFormat;

TranscriptionResult SampleResult() {
  TranscriptionResult result;
  result.text            = "Hello there. General Kenobi.";
  result.language        = "en";
  result.duration        = 3726.0;
  result.processing_time = 12.5;
  result.model_used      = "medium";
  result.segments        = {
      {0.0, 2.5, " Hello there.", {0.9, 0.8}},
      {3725.25, 3726.0, " General Kenobi. ", {0.6}},
  };
  return result;
}

void TestParseOutputFormat() {
  assert(scribe::output::ParseOutputFormat("txt") == OutputFormat::kText);
  assert(scribe::output::ParseOutputFormat("SRT") == OutputFormat::kSubtitle);
  assert(scribe::output::ParseOutputFormat("vtt") == OutputFormat::kWebSubtitle);
  assert(scribe::output::ParseOutputFormat("Json") == OutputFormat::kStructured);
  assert(!scribe::output::ParseOutputFormat("docx"));
}

void TestPlainTextEndsWithNewline() {
  auto serializer = MakeSerializer(OutputFormat::kText);
  assert(serializer->Extension() == ".txt");
  assert(serializer->Render(SampleResult()) == "Hello there. General Kenobi.\n");
}

void TestTextWithTimestamps() {
  auto serializer = MakeSerializer(OutputFormat::kText, true);
  assert(serializer->Render(SampleResult()) ==
         "[00:00:00 --> 00:00:02] Hello there.\n"
         "[01:02:05 --> 01:02:06] General Kenobi.\n");
}

void TestSubtitleCues() {
  auto serializer = MakeSerializer(OutputFormat::kSubtitle);
  assert(serializer->Extension() == ".srt");
  assert(serializer->Render(SampleResult()) ==
         "1\n00:00:00,000 --> 00:00:02,500\nHello there.\n\n"
         "2\n01:02:05,250 --> 01:02:06,000\nGeneral Kenobi.\n\n");
}

void TestWebSubtitleHeader() {
  auto serializer = MakeSerializer(OutputFormat::kWebSubtitle);
  assert(serializer->Extension() == ".vtt");
  assert(serializer->Render(SampleResult()) ==
         "WEBVTT\n\n"
         "00:00:00.000 --> 00:00:02.500\nHello there.\n\n"
         "01:02:05.250 --> 01:02:06.000\nGeneral Kenobi.\n\n");
}

void TestStructuredDocument() {
  const auto doc = scribe::output::ToDocument(SampleResult());
  assert(doc.segments_size() == 2);
  assert(doc.confidence_scores_size() == 3);
  assert(doc.metadata().total_segments() == 2);
  assert(doc.metadata().total_words() == 4);
  const double expected = (0.9 + 0.8 + 0.6) / 3.0;
  assert(doc.metadata().average_confidence() > expected - 1e-9);
  assert(doc.metadata().average_confidence() < expected + 1e-9);

  auto       serializer = MakeSerializer(OutputFormat::kStructured);
  const auto json       = serializer->Render(SampleResult());
  assert(serializer->Extension() == ".json");
  assert(json.find("\"model_used\"") != std::string::npos);
  assert(json.find("\"processing_time\"") != std::string::npos);
  assert(json.find("\"total_words\": 4") != std::string::npos);

  scribe::v1::TranscriptDocument parsed;
  assert(google::protobuf::util::JsonStringToMessage(json, &parsed).ok());
  assert(parsed.text() == "Hello there. General Kenobi.");
  assert(parsed.language() == "en");
}

void TestEmptyResultRendersWithoutSegments() {
  TranscriptionResult empty;
  assert(MakeSerializer(OutputFormat::kText)->Render(empty).empty());
  assert(MakeSerializer(OutputFormat::kSubtitle)->Render(empty).empty());
  assert(MakeSerializer(OutputFormat::kWebSubtitle)->Render(empty) == "WEBVTT\n\n");

  const auto doc = scribe::output::ToDocument(empty);
  assert(doc.metadata().average_confidence() == 0.0);
  assert(doc.metadata().total_words() == 0);
}

} // namespace

int main() {
  TestParseOutputFormat();
  TestPlainTextEndsWithNewline();
  TestTextWithTimestamps();
  TestSubtitleCues();
  TestWebSubtitleHeader();
  TestStructuredDocument();
  TestEmptyResultRendersWithoutSegments();

  std::cout << "mediascribe_unit_serializer: pass\n";
  return 0;
}
