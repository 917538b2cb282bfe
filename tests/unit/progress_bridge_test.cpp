#include "internal/bridge/progress_bridge.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using scribe::bridge::BridgeOptions;
using scribe::bridge::CancellationToken;
using scribe::bridge::FfmpegProgressParser;
using scribe::bridge::MonotonicProgress;
using scribe::bridge::NullProgressParser;
using scribe::bridge::ProgressBridge;
using scribe::bridge::WhisperProgressParser;

std::vector<std::string> Shell(const std::string& script) {
  return {"/bin/sh", "-c", script};
}

BridgeOptions FastOptions() {
  BridgeOptions options;
  options.stall_timeout = 2000ms;
  options.kill_grace    = 200ms;
  return options;
}

void TestProgressIsNormalizedAgainstDuration() {
  ProgressBridge       bridge(FastOptions(), CancellationToken{});
  FfmpegProgressParser parser;

  std::vector<double> seen;
  MonotonicProgress   progress([&](double v) { seen.push_back(v); });

  const auto result =
      bridge.Run(Shell("echo out_time_us=500000; echo out_time_us=1000000; echo out_time_us=9000000; echo progress=end"),
                 2.0, parser, progress);

  assert(result.exit_code == 0);
  assert(result.stdout_text.find("progress=end") != std::string::npos);
  assert(seen.size() == 3);
  assert(std::fabs(seen[0] - 0.25) < 1e-9);
  assert(std::fabs(seen[1] - 0.5) < 1e-9);
  assert(seen[2] == 1.0);
}

void TestCarriageReturnSeparatesLines() {
  ProgressBridge        bridge(FastOptions(), CancellationToken{});
  WhisperProgressParser parser;
  MonotonicProgress     progress;

  (void)bridge.Run(Shell("printf 'progress = 10%%\\rprogress = 55%%\\r' >&2"), 0.0, parser, progress);
  assert(std::fabs(progress.value() - 0.55) < 1e-9);
}

void TestNonZeroExitCarriesStderrTail() {
  ProgressBridge     bridge(FastOptions(), CancellationToken{});
  NullProgressParser parser;
  MonotonicProgress  progress;

  bool threw = false;
  try {
    (void)bridge.Run(Shell("echo first >&2; echo 'Invalid data found' >&2; exit 3"), 0.0, parser, progress);
  } catch (const scribe::util::EngineFailure& e) {
    threw = true;
    assert(std::string(e.what()).find("code 3") != std::string::npos);
    assert(e.diagnostics().find("Invalid data found") != std::string::npos);
  }
  assert(threw);
}

void TestMissingProgramFails() {
  ProgressBridge     bridge(FastOptions(), CancellationToken{});
  NullProgressParser parser;
  MonotonicProgress  progress;

  bool threw = false;
  try {
    (void)bridge.Run({"/nonexistent/engine-binary"}, 0.0, parser, progress);
  } catch (const scribe::util::EngineFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestStalledChildIsKilled() {
  auto options          = FastOptions();
  options.stall_timeout = 300ms;

  ProgressBridge     bridge(options, CancellationToken{});
  NullProgressParser parser;
  MonotonicProgress  progress;

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    (void)bridge.Run(Shell("echo started; sleep 30"), 0.0, parser, progress);
  } catch (const scribe::util::EngineFailure& e) {
    threw = true;
    assert(std::string(e.what()).find("stalled") != std::string::npos);
  }
  assert(threw);
  assert(std::chrono::steady_clock::now() - started < 10s);
}

void TestRuntimeLimitKillsChattyChild() {
  auto options          = FastOptions();
  options.stall_timeout = 0ms;
  options.max_runtime   = 400ms;

  ProgressBridge     bridge(options, CancellationToken{});
  NullProgressParser parser;
  MonotonicProgress  progress;

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    (void)bridge.Run(Shell("while true; do echo tick; sleep 0.05; done"), 0.0, parser, progress);
  } catch (const scribe::util::EngineFailure& e) {
    threw = true;
    assert(std::string(e.what()).find("runtime limit") != std::string::npos);
  }
  assert(threw);
  assert(std::chrono::steady_clock::now() - started < 10s);
}

void TestCancellationTerminatesChild() {
  CancellationToken  token;
  ProgressBridge     bridge(FastOptions(), token);
  NullProgressParser parser;
  MonotonicProgress  progress;

  std::thread canceller([token] {
    std::this_thread::sleep_for(200ms);
    token.Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    (void)bridge.Run(Shell("while true; do echo tick; sleep 0.05; done"), 0.0, parser, progress);
  } catch (const scribe::util::CancelledError&) {
    threw = true;
  }
  canceller.join();

  assert(threw);
  assert(std::chrono::steady_clock::now() - started < 10s);
}

void TestAlreadyCancelledDoesNotSpawn() {
  CancellationToken token;
  token.Cancel();

  ProgressBridge     bridge(FastOptions(), token);
  NullProgressParser parser;
  MonotonicProgress  progress;

  bool threw = false;
  try {
    (void)bridge.Run(Shell("exit 0"), 0.0, parser, progress);
  } catch (const scribe::util::CancelledError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestProgressIsNormalizedAgainstDuration();
  TestCarriageReturnSeparatesLines();
  TestNonZeroExitCarriesStderrTail();
  TestMissingProgramFails();
  TestStalledChildIsKilled();
  TestRuntimeLimitKillsChattyChild();
  TestCancellationTerminatesChild();
  TestAlreadyCancelledDoesNotSpawn();

  std::cout << "mediascribe_unit_progress_bridge: pass\n";
  return 0;
}
