#include <cassert>
#include <algorithm>
#include <iostream>

#include "internal/engine/ffmpeg_extractor.hpp"
#include "internal/engine/ffprobe_probe.hpp"
#include "internal/engine/whisper_cli_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using scribe::engine::FfmpegExtractor;
using scribe::engine::FfprobeProbe;
using scribe::engine::WhisperCliEngine;

std::shared_ptr<scribe::bridge::ProgressBridge> Bridge() {
  return std::make_shared<scribe::bridge::ProgressBridge>(scribe::bridge::BridgeOptions{},
                                                          scribe::bridge::CancellationToken{});
}

bool Contains(const std::vector<std::string>& argv, const std::string& value) {
  return std::find(argv.begin(), argv.end(), value) != argv.end();
}

void TestProbeJsonWithAudioAndVideo() {
  const auto info = FfprobeProbe::ParseProbeJson(R"({
    "streams": [
      {"index": 0, "codec_type": "video", "codec_name": "h264", "width": 1280},
      {"index": 1, "codec_type": "audio", "codec_name": "aac", "duration": "12.400000"}
    ],
    "format": {"filename": "clip.mp4", "duration": "12.480000", "size": "1048576"}
  })");

  assert(info.has_video);
  assert(info.has_audio);
  assert(info.duration > 12.47 && info.duration < 12.49);
}

void TestProbeJsonWithoutAudio() {
  const auto info = FfprobeProbe::ParseProbeJson(R"({
    "streams": [{"codec_type": "video"}],
    "format": {"duration": "3.0"}
  })");
  assert(info.has_video);
  assert(!info.has_audio);
}

void TestProbeFallsBackToStreamDuration() {
  const auto info = FfprobeProbe::ParseProbeJson(R"({
    "streams": [{"codec_type": "audio", "duration": "7.5"}],
    "format": {}
  })");
  assert(info.duration == 7.5);
}

void TestProbeRejectsGarbage() {
  bool threw = false;
  try {
    (void)FfprobeProbe::ParseProbeJson("not json");
  } catch (const scribe::util::EngineFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestFfmpegCommand() {
  FfmpegExtractor extractor("ffmpeg", Bridge());

  scribe::engine::AudioSpec spec;
  spec.sample_rate = 16000;
  spec.channels    = 1;

  auto argv = extractor.BuildCommand("/in/a.mp4", "/tmp/a.wav", spec);
  assert(argv.front() == "ffmpeg");
  assert(argv.back() == "/tmp/a.wav");
  assert(Contains(argv, "pipe:1"));
  assert(Contains(argv, "pcm_s16le"));
  assert(Contains(argv, "16000"));
  assert(Contains(argv, "-vn"));
  assert(!Contains(argv, "-af"));

  spec.normalize      = true;
  spec.remove_silence = true;
  argv                = extractor.BuildCommand("/in/a.mp4", "/tmp/a.wav", spec);
  const auto af       = std::find(argv.begin(), argv.end(), "-af");
  assert(af != argv.end());
  assert((af + 1)->find("loudnorm,silenceremove=") == 0);
}

void TestWhisperCommand() {
  scribe::engine::WhisperOptions options;
  options.whisper_path = "whisper-cli";
  options.model_path   = "/models/ggml-medium.bin";
  options.threads      = 4;

  WhisperCliEngine engine(options, Bridge());
  const auto       argv = engine.BuildCommand("/tmp/a_1234abcd.wav", "/tmp/a_1234abcd", "auto");

  assert(argv.front() == "whisper-cli");
  assert(Contains(argv, "/models/ggml-medium.bin"));
  assert(Contains(argv, "-ojf"));
  assert(Contains(argv, "-pp"));
  assert(Contains(argv, "/tmp/a_1234abcd"));
  assert(Contains(argv, "4"));
}

void TestWhisperJsonParsing() {
  const auto result = WhisperCliEngine::ParseResultJson(R"({
    "model": {"type": "medium"},
    "result": {"language": "de"},
    "transcription": [
      {
        "timestamps": {"from": "00:00:00,000", "to": "00:00:02,500"},
        "offsets": {"from": 0, "to": 2500},
        "text": " Guten Tag.",
        "tokens": [
          {"text": "[_BEG_]", "p": 0.99},
          {"text": " Guten", "p": 0.91},
          {"text": " Tag", "p": 0.82},
          {"text": "[_TT_125]", "p": 0.5}
        ]
      },
      {
        "offsets": {"from": 2500, "to": 4000},
        "text": " Wie geht's?"
      }
    ]
  })", "auto");

  assert(result.language == "de");
  assert(result.text == "Guten Tag. Wie geht's?");
  assert(result.segments.size() == 2);
  assert(result.segments[0].start == 0.0);
  assert(result.segments[0].end == 2.5);
  assert(result.segments[0].confidence.size() == 2);
  assert(result.segments[1].confidence.empty());
  assert(result.duration == 4.0);
}

void TestWhisperJsonWithoutSegmentsIsEmpty() {
  const auto result = WhisperCliEngine::ParseResultJson(R"({"transcription": []})", "en");
  assert(result.text.empty());
  assert(result.language == "en");
  assert(result.segments.empty());
}

} // namespace

int main() {
  TestProbeJsonWithAudioAndVideo();
  TestProbeJsonWithoutAudio();
  TestProbeFallsBackToStreamDuration();
  TestProbeRejectsGarbage();
  TestFfmpegCommand();
  TestWhisperCommand();
  TestWhisperJsonParsing();
  TestWhisperJsonWithoutSegmentsIsEmpty();

  std::cout << "mediascribe_unit_engine_output: pass\n";
  return 0;
}
