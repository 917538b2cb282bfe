#pragma once

#include <atomic>
#include <memory>

namespace scribe::bridge {

/*
  Cooperative cancellation flag shared between the signal watcher, the
  scheduler, every pipeline and every supervised child process.

  Copies share one flag. Once set it is never cleared.
*/
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  void Cancel() const noexcept {
    flag_->store(true, std::memory_order_release);
  }

  bool IsCancelled() const noexcept {
    return flag_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace scribe::bridge
