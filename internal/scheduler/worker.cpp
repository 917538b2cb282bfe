#include "worker.hpp"

#include "internal/observability/logging.hpp"

namespace scribe::scheduler {

Worker::Worker(std::shared_ptr<WorkQueue> queue, TaskFn task) : queue_(std::move(queue)), task_(std::move(task)) {
}

Worker::~Worker() {
  Join();
}

void Worker::Start() {
  thread_ = std::thread(&Worker::Run, this);
}

void Worker::Join() {
  if (thread_.joinable()) thread_.join();
}

void Worker::Run() {
  while (auto item = queue_->Dequeue()) {
    try {
      task_(*item);
    } catch (const std::exception& e) {
      // The pipeline converts per-file errors itself; anything here is a bug.
      SCRIBE_LOG_ERROR("worker task escaped with exception", {observability::StringField("file", item->path.string()),
                                                              observability::StringField("error", e.what())});
    }
  }
}

} // namespace scribe::scheduler
