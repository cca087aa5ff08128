#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace powerscore::pipeline {

// Index of one cohort in the run's cohort list.
struct CohortTask {
  std::size_t index = 0;
};

/*
  Thread-safe blocking queue feeding the cohort workers.
  After Shutdown(), Dequeue() drains what is left and then returns nullopt.
*/
class CohortTaskQueue {
 public:
  void Enqueue(const CohortTask& task);

  // blocking wait
  std::optional<CohortTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<CohortTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace powerscore::pipeline
