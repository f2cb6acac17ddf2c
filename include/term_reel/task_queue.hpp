/**
 * @file task_queue.hpp
 * @brief Thread-safe task queue and result collection
 *
 * @details Provides:
 *          - TaskQueue: blocking queue feeding batch workers
 *
 *          - ResultCollector: Thread-safe aggregator for per-file results
 */

#ifndef TERM_REEL_TASK_QUEUE_HPP
#define TERM_REEL_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace term_reel {

/**
 * @struct FinalizeTask
 * @brief One raw capture to finalize.
 */
struct FinalizeTask {
  std::string input_path;
  std::string output_path;
  int id = 0; //< Position in the batch, for log prefixes
};

/**
 * @struct BatchResult
 * @brief Outcome of finalizing one raw capture.
 */
struct BatchResult {
  std::string filename;
  bool success = false;
  size_t frames = 0; //< Frames in the finalized session
  size_t keystrokes_retracted = 0;
  long processing_time_us = 0;
  std::string error; //< Empty on success
};

/**
 * @class TaskQueue
 * @brief Thread-safe queue workers pull from until finish() is called.
 *
 * @note Sessions are independent values, so the queue is the only state
 *       workers share (besides the ResultCollector).
 */
class TaskQueue {
  std::queue<FinalizeTask> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(FinalizeTask task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @param task Output parameter for the task
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(FinalizeTask &task);

  /**
   * @brief Signal that no more tasks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

/**
 * @class ResultCollector
 * @brief Thread-safe aggregator for batch results.
 */
class ResultCollector {
  std::vector<BatchResult> results;
  std::mutex mutex;

public:
  void reserve(size_t n);

  void add(BatchResult &&result);

  /**
   * @brief Extract all collected results.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<BatchResult> extract();
};

} // namespace term_reel

#endif // TERM_REEL_TASK_QUEUE_HPP
