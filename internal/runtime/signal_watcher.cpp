#include "signal_watcher.hpp"

#include <signal.h>
#include <time.h>

#include <cstdlib>

#include "internal/observability/logging.hpp"

namespace scribe::runtime {

namespace {

sigset_t TerminationSignals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

// Exit status convention for death by signal.
constexpr int kForcedExitBase = 128;

} // namespace

SignalWatcher::SignalWatcher(scribe::bridge::CancellationToken token) : token_(std::move(token)) {
}

SignalWatcher::~SignalWatcher() {
  Stop();
}

void SignalWatcher::Block() {
  const sigset_t set = TerminationSignals();
  ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

void SignalWatcher::Start() {
  running_ = true;
  thread_  = std::thread(&SignalWatcher::Run, this);
}

void SignalWatcher::Stop() {
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void SignalWatcher::Run() {
  const sigset_t set = TerminationSignals();

  // sigtimedwait so Stop() is noticed without sending ourselves a signal.
  const timespec timeout{0, 200 * 1000 * 1000};

  while (running_) {
    const int sig = ::sigtimedwait(&set, nullptr, &timeout);
    if (sig < 0) {
      continue;  // EAGAIN on timeout, EINTR
    }

    if (token_.IsCancelled()) {
      SCRIBE_LOG_WARN("second signal received, exiting immediately", {observability::IntField("signal", sig)});
      observability::ShutdownLogging();
      std::_Exit(kForcedExitBase + sig);
    }

    SCRIBE_LOG_WARN("shutdown requested, finishing in-flight work", {observability::IntField("signal", sig)});
    token_.Cancel();
  }
}

} // namespace scribe::runtime
