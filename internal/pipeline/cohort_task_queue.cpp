#include "cohort_task_queue.hpp"

namespace powerscore::pipeline {

void CohortTaskQueue::Enqueue(const CohortTask& task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<CohortTask> CohortTaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  CohortTask task = queue_.front();
  queue_.pop();
  return task;
}

void CohortTaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace powerscore::pipeline
