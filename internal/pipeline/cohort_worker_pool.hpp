#pragma once

#include <cstddef>
#include <functional>

namespace powerscore::pipeline {

/*
  Runs the per-cohort stages on a bounded set of threads.

  Threads are started by Run() and joined before it returns; nothing
  outlives a run. Each task writes only to its own result slot, so
  output order follows cohort index, not completion order.

  A task that throws does not stop the others. After every worker has
  joined, the failure with the lowest cohort index is rethrown.
*/
class CohortWorkerPool {
 public:
  // 0 means std::thread::hardware_concurrency().
  explicit CohortWorkerPool(std::size_t threads);

  void Run(std::size_t task_count, const std::function<void(std::size_t)>& task);

  std::size_t Threads() const {
    return threads_;
  }

 private:
  std::size_t threads_;
};

} // namespace powerscore::pipeline
