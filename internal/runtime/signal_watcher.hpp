#pragma once

#include <atomic>
#include <thread>

#include "internal/bridge/cancellation.hpp"

namespace scribe::runtime {

/*
  Receives SIGINT and SIGTERM on a dedicated thread and cancels the token.

  Block() must run on the main thread before any other thread is started so
  that every thread inherits the blocked mask and only sigwait sees the
  signals. A second signal while cancellation is in progress exits at once.
*/
class SignalWatcher {
 public:
  explicit SignalWatcher(scribe::bridge::CancellationToken token);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher&)            = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  static void Block();

  void Start();
  void Stop();

 private:
  void Run();

  scribe::bridge::CancellationToken token_;
  std::thread                       thread_;
  std::atomic<bool>                 running_{false};
};

} // namespace scribe::runtime
