#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "work_queue.hpp"

namespace scribe::scheduler {

/*
  Pool thread. Pulls items from the shared queue until it is shut down and
  drained, handing each one to the task function.
*/
class Worker {
 public:
  using TaskFn = std::function<void(const scribe::model::WorkItem&)>;

  Worker(std::shared_ptr<WorkQueue> queue, TaskFn task);
  ~Worker();

  Worker(const Worker&)            = delete;
  Worker& operator=(const Worker&) = delete;

  void Start();
  void Join();

 private:
  void Run();

  std::shared_ptr<WorkQueue> queue_;
  TaskFn                     task_;
  std::thread                thread_;
};

} // namespace scribe::scheduler
