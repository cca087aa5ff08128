#include "cohort_worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <vector>

#include "cohort_task_queue.hpp"
#include "internal/observability/logging.hpp"

namespace powerscore::pipeline {

CohortWorkerPool::CohortWorkerPool(std::size_t threads) : threads_(threads) {
  if (threads_ == 0) {
    threads_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
}

void CohortWorkerPool::Run(std::size_t task_count, const std::function<void(std::size_t)>& task) {
  if (task_count == 0) return;

  CohortTaskQueue queue;
  for (std::size_t i = 0; i < task_count; ++i) {
    queue.Enqueue({i});
  }
  queue.Shutdown();

  std::vector<std::exception_ptr> failures(task_count);

  const std::size_t        worker_count = std::min(threads_, task_count);
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (std::size_t w = 0; w < worker_count; ++w) {
    workers.emplace_back([&] {
      while (auto next = queue.Dequeue()) {
        try {
          task(next->index);
        } catch (...) {
          failures[next->index] = std::current_exception();
        }
      }
    });
  }

  for (auto& worker : workers) {
    worker.join();
  }

  for (std::size_t i = 0; i < failures.size(); ++i) {
    if (failures[i]) {
      POWERSCORE_LOG_ERROR("cohort task failed", {observability::IntField("cohort_index", static_cast<std::int64_t>(i))});
      std::rethrow_exception(failures[i]);
    }
  }
}

} // namespace powerscore::pipeline
