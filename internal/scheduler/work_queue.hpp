#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/model/work_item.hpp"

namespace scribe::scheduler {

/*
  Thread-safe blocking FIFO shared by the scheduler's workers.

  After Shutdown, Dequeue keeps returning queued items until the queue is
  empty, then nullopt.
*/
class WorkQueue {
 public:
  void Enqueue(scribe::model::WorkItem item);

  // blocking wait
  std::optional<scribe::model::WorkItem> Dequeue();

  void Shutdown();

  size_t Size() const;

 private:
  mutable std::mutex                  mutex_;
  std::condition_variable             cv_;
  std::deque<scribe::model::WorkItem> queue_;
  bool                                shutdown_ = false;
};

} // namespace scribe::scheduler
