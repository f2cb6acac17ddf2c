/**
 * @file batch_finalizer.hpp
 * @brief Parallel finalization of raw captures
 *
 * @details The BatchFinalizer turns a directory of raw captures into
 *          finalized recordings:
 *
 *          - Spawns PARALLEL_JOBS worker threads
 *
 *          - Workers pull files from a shared TaskQueue
 *
 *          - Each file is loaded, post-processed and saved independently
 *
 *          - Per-file outcomes are gathered in a ResultCollector
 *
 * @note A failing file never stops the batch; it is reported in the
 *       summary and counted in the return value.
 */

#ifndef TERM_REEL_BATCH_FINALIZER_HPP
#define TERM_REEL_BATCH_FINALIZER_HPP

#include <string>
#include <vector>

#include "task_queue.hpp"

namespace term_reel {

/**
 * @class BatchFinalizer
 * @brief Finalizes many raw captures concurrently.
 */
class BatchFinalizer {
public:
  /**
   * @brief Construct a batch finalizer.
   * @param num_jobs Worker threads (0 = one per hardware thread)
   */
  explicit BatchFinalizer(int num_jobs = 0);

  /**
   * @brief Finalize every input into output_dir/<stem>.pcr.
   * @return Number of failures (0 = all succeeded)
   */
  int process(const std::vector<std::string> &input_files,
              const std::string &output_dir);

  /// Per-file outcomes of the last process() call, in completion order.
  const std::vector<BatchResult> &results() const { return results_; }

  int num_jobs() const { return num_jobs_; }

private:
  int num_jobs_;
  std::vector<BatchResult> results_;

  /**
   * @brief Worker loop: pop, finalize, record, repeat.
   */
  void worker(int worker_id, TaskQueue &queue, ResultCollector &collector);

  /**
   * @brief Print final batch summary (stderr).
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec) const;
};

} // namespace term_reel

#endif // TERM_REEL_BATCH_FINALIZER_HPP
