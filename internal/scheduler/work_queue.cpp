#include "work_queue.hpp"

namespace scribe::scheduler {

void WorkQueue::Enqueue(scribe::model::WorkItem item) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(item));
  }
  cv_.notify_one();
}

std::optional<scribe::model::WorkItem> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  auto item = std::move(queue_.front());
  queue_.pop_front();
  return item;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t WorkQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace scribe::scheduler
