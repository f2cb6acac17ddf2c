/**
 * @file task_queue.cpp
 * @brief Thread-safe task queue and result collection implementation
 *
 * @details Provides implementations for:
 *
 *          - TaskQueue: blocking queue feeding batch workers
 *
 *          - ResultCollector: Thread-safe aggregator for per-file results
 */

#include "term_reel/task_queue.hpp"

#include <utility>

namespace term_reel {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(FinalizeTask task) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.push(std::move(task));
  cv.notify_one();
}

bool TaskQueue::pop(FinalizeTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- ResultCollector Implementation -----**

void ResultCollector::reserve(size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  results.reserve(n);
}

void ResultCollector::add(BatchResult &&result) {
  std::lock_guard<std::mutex> lock(mutex);
  results.push_back(std::move(result));
}

std::vector<BatchResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::move(results);
}

} // namespace term_reel
