#include "internal/pipeline/cohort_worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using powerscore::pipeline::CohortWorkerPool;

void TestEveryTaskRunsOnceIntoItsSlot() {
  CohortWorkerPool pool(4);

  std::vector<int>              slots(100, 0);
  std::vector<std::atomic<int>> runs(100);
  pool.Run(slots.size(), [&](std::size_t i) {
    slots[i] = static_cast<int>(i) * 2;
    runs[i].fetch_add(1);
  });

  for (std::size_t i = 0; i < slots.size(); ++i) {
    assert(slots[i] == static_cast<int>(i) * 2);
    assert(runs[i].load() == 1);
  }
}

void TestLowestFailingIndexIsRethrown() {
  CohortWorkerPool pool(3);

  std::atomic<int> finished{0};
  bool             caught = false;
  try {
    pool.Run(10, [&](std::size_t i) {
      if (i == 7) throw std::runtime_error("cohort 7");
      if (i == 2) throw std::runtime_error("cohort 2");
      finished.fetch_add(1);
    });
  } catch (const std::runtime_error& e) {
    caught = std::string(e.what()) == "cohort 2";
  }
  assert(caught);
  // a failure does not stop the other cohorts
  assert(finished.load() == 8);
}

void TestZeroThreadsUsesHardware() {
  CohortWorkerPool pool(0);
  const auto       hw = std::thread::hardware_concurrency();
  assert(pool.Threads() == (hw == 0 ? 1u : hw));
  assert(CohortWorkerPool(5).Threads() == 5);
}

void TestNoTasks() {
  CohortWorkerPool pool(2);
  bool             called = false;
  pool.Run(0, [&](std::size_t) { called = true; });
  assert(!called);
}

} // namespace

int main() {
  TestEveryTaskRunsOnceIntoItsSlot();
  TestLowestFailingIndexIsRethrown();
  TestZeroThreadsUsesHardware();
  TestNoTasks();

  std::cout << "cohort_worker_pool_test: pass\n";
  return 0;
}
