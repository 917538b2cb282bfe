#include "progress_bridge.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <deque>
#include <functional>
#include <stdexcept>
#include <optional>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace scribe::bridge {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollInterval{50};

/*
  Owns a pipe fd. Closed on scope exit.
*/
class Fd {
 public:
  explicit Fd(int fd = -1) : fd_(fd) {
  }
  ~Fd() {
    Reset();
  }
  Fd(Fd&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
  }
  Fd(const Fd&)            = delete;
  Fd& operator=(const Fd&) = delete;

  int get() const {
    return fd_;
  }
  void Reset() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_;
};

struct Pipe {
  Fd read;
  Fd write;
};

Pipe MakePipe() {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw util::EngineFailure(std::string("pipe failed: ") + std::strerror(errno));
  }
  return Pipe{Fd(fds[0]), Fd(fds[1])};
}

/*
  Splits a byte stream into lines. \r counts as a terminator because engines
  redraw progress with carriage returns.
*/
class LineSplitter {
 public:
  template <typename Fn>
  void Feed(const char* data, size_t n, Fn&& on_line) {
    for (size_t i = 0; i < n; ++i) {
      const char c = data[i];
      if (c == '\n' || c == '\r') {
        if (!partial_.empty()) on_line(partial_);
        partial_.clear();
      } else {
        partial_.push_back(c);
      }
    }
  }

  template <typename Fn>
  void Flush(Fn&& on_line) {
    if (!partial_.empty()) on_line(partial_);
    partial_.clear();
  }

 private:
  std::string partial_;
};

struct Stream {
  Fd                                     fd;
  std::function<void(const std::string&)> on_line;
  LineSplitter                           splitter;
  bool                                   open = true;
};

enum class StopReason {
  kNone,
  kStalled,
  kRuntimeExceeded,
  kCancelled,
  kIoError,
};

// SIGTERM to the child's process group, SIGKILL after grace. Reaps the child.
int Terminate(pid_t pid, std::chrono::milliseconds grace) {
  ::kill(-pid, SIGTERM);

  int        status   = 0;
  const auto deadline = SteadyClock::now() + grace;
  while (SteadyClock::now() < deadline) {
    const pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) return status;
    if (r < 0 && errno != EINTR) return status;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  ::kill(-pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  return status;
}

} // namespace

ProgressBridge::ProgressBridge(BridgeOptions options, CancellationToken token)
    : options_(options), token_(std::move(token)) {
}

ProcessResult ProgressBridge::Run(const std::vector<std::string>& argv, double total_duration_hint,
                                  ProgressParser& parser, ProgressReporter& reporter) const {
  if (argv.empty()) {
    throw std::invalid_argument("empty command line");
  }
  if (token_.IsCancelled()) {
    throw util::CancelledError("cancelled before start: " + argv.front());
  }

  // Everything the child touches is prepared before fork.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) cargv.push_back(const_cast<char*>(arg.c_str()));
  cargv.push_back(nullptr);

  Pipe out_pipe = MakePipe();
  Pipe err_pipe = MakePipe();
  const int child_out = out_pipe.write.get();
  const int child_err = err_pipe.write.get();

  const auto  started = SteadyClock::now();
  const pid_t pid     = ::fork();
  if (pid < 0) {
    throw util::EngineFailure(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    // Child: own process group so the whole tree can be signalled.
    ::setpgid(0, 0);

    // The parent blocks termination signals for its sigwait thread.
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    ::dup2(child_out, STDOUT_FILENO);
    ::dup2(child_err, STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());

    const char msg[] = "exec failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
  }

  // Parent.
  ::setpgid(pid, pid);
  out_pipe.write.Reset();
  err_pipe.write.Reset();

  ProcessResult           result;
  std::deque<std::string> tail;

  auto on_event = [&](std::string_view line) {
    const auto event = parser.Parse(line);
    switch (event.kind) {
      case ProgressEvent::Kind::kPosition:
        if (total_duration_hint > 0.0) reporter.Report(event.value / total_duration_hint);
        break;
      case ProgressEvent::Kind::kRatio:
        reporter.Report(event.value);
        break;
      case ProgressEvent::Kind::kEnd:
        reporter.Report(1.0);
        break;
      case ProgressEvent::Kind::kNone:
        break;
    }
  };

  auto on_stdout = [&](const std::string& line) {
    if (result.stdout_text.size() + line.size() + 1 <= options_.max_stdout_bytes) {
      result.stdout_text.append(line);
      result.stdout_text.push_back('\n');
    }
    on_event(line);
  };

  auto on_stderr = [&](const std::string& line) {
    tail.push_back(line);
    while (tail.size() > options_.diagnostic_lines) tail.pop_front();
    on_event(line);
  };

  Stream out{std::move(out_pipe.read), on_stdout};
  Stream err{std::move(err_pipe.read), on_stderr};
  ::fcntl(out.fd.get(), F_SETFL, O_NONBLOCK);
  ::fcntl(err.fd.get(), F_SETFL, O_NONBLOCK);

  SCRIBE_LOG_DEBUG("engine started", {observability::StringField("program", argv.front()),
                                      observability::IntField("pid", pid)});

  auto last_activity = SteadyClock::now();
  auto stop          = StopReason::kNone;

  auto check_limits = [&]() {
    const auto now = SteadyClock::now();
    if (token_.IsCancelled()) return StopReason::kCancelled;
    if (options_.stall_timeout.count() > 0 && now - last_activity > options_.stall_timeout) {
      return StopReason::kStalled;
    }
    if (options_.max_runtime.count() > 0 && now - started > options_.max_runtime) {
      return StopReason::kRuntimeExceeded;
    }
    return StopReason::kNone;
  };

  // ------------------------------------------------------------
  // Pump both streams until EOF
  // ------------------------------------------------------------

  char buffer[4096];
  while (out.open || err.open) {
    pollfd  fds[2];
    Stream* streams[2];
    nfds_t  n = 0;
    for (Stream* s : {&out, &err}) {
      if (!s->open) continue;
      fds[n]       = pollfd{s->fd.get(), POLLIN, 0};
      streams[n++] = s;
    }

    const int ready = ::poll(fds, n, static_cast<int>(kPollInterval.count()));
    if (ready < 0 && errno != EINTR) {
      stop = StopReason::kIoError;
      break;
    }

    for (nfds_t i = 0; ready > 0 && i < n; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

      Stream* s = streams[i];
      for (;;) {
        const ssize_t got = ::read(s->fd.get(), buffer, sizeof(buffer));
        if (got > 0) {
          last_activity = SteadyClock::now();
          s->splitter.Feed(buffer, static_cast<size_t>(got), s->on_line);
          continue;
        }
        if (got == 0) {
          s->splitter.Flush(s->on_line);
          s->open = false;
          s->fd.Reset();
        } else if (errno == EINTR) {
          continue;
        }
        break;
      }
    }

    stop = check_limits();
    if (stop != StopReason::kNone) break;
  }

  // ------------------------------------------------------------
  // Reap
  // ------------------------------------------------------------

  int status = 0;
  if (stop == StopReason::kNone) {
    for (;;) {
      const pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) break;
      if (r < 0 && errno != EINTR) {
        throw util::EngineFailure(std::string("waitpid failed: ") + std::strerror(errno));
      }
      stop = check_limits();
      if (stop != StopReason::kNone) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  if (stop != StopReason::kNone) {
    status = Terminate(pid, options_.kill_grace);
  }

  result.elapsed_seconds =
      std::chrono::duration<double>(SteadyClock::now() - started).count();

  for (const auto& line : tail) {
    result.diagnostics.append(line);
    result.diagnostics.push_back('\n');
  }

  const std::string program = argv.front();
  switch (stop) {
    case StopReason::kCancelled:
      throw util::CancelledError("cancelled while running " + program);
    case StopReason::kStalled:
      throw util::EngineFailure(program + " stalled with no output for " +
                                    std::to_string(options_.stall_timeout.count()) + " ms",
                                result.diagnostics);
    case StopReason::kRuntimeExceeded:
      throw util::EngineFailure(program + " exceeded the runtime limit of " +
                                    std::to_string(options_.max_runtime.count()) + " ms",
                                result.diagnostics);
    case StopReason::kIoError:
      throw util::EngineFailure("lost output streams of " + program, result.diagnostics);
    case StopReason::kNone:
      break;
  }

  if (WIFSIGNALED(status)) {
    throw util::EngineFailure(program + " terminated by signal " + std::to_string(WTERMSIG(status)),
                              result.diagnostics);
  }

  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.exit_code != 0) {
    throw util::EngineFailure(program + " exited with code " + std::to_string(result.exit_code), result.diagnostics);
  }

  SCRIBE_LOG_DEBUG("engine finished", {observability::StringField("program", program),
                                       observability::DoubleField("elapsed_s", result.elapsed_seconds)});
  return result;
}

} // namespace scribe::bridge
