/**
 * @file batch_finalizer.cpp
 * @brief Parallel finalization of raw captures implementation
 */

#include "term_reel/batch_finalizer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "term_reel/logging.hpp"
#include "term_reel/post_processor.hpp"
#include "term_reel/session_io.hpp"
#include "term_reel/types.hpp"

namespace term_reel {

namespace fs = std::filesystem;

BatchFinalizer::BatchFinalizer(int num_jobs) {
  if (num_jobs <= 0) {
    num_jobs_ = static_cast<int>(std::thread::hardware_concurrency());
  } else {
    num_jobs_ = num_jobs;
  }
  num_jobs_ = std::max(1, num_jobs_);
}

int BatchFinalizer::process(const std::vector<std::string> &input_files,
                            const std::string &output_dir) {
  results_.clear();
  if (input_files.empty()) {
    LOG_WARN("No raw captures to finalize");
    return 0;
  }

  int workers_needed =
      std::min(num_jobs_, static_cast<int>(input_files.size()));

  LOG_PHASE("================== BATCH FINALIZE ==================");
  LOG_INFO("Files to finalize: {}", input_files.size());
  LOG_INFO("Parallel jobs: {}", workers_needed);
  LOG_PHASE("====================================================");

  auto batch_start = std::chrono::steady_clock::now();

  TaskQueue queue;
  ResultCollector collector;
  collector.reserve(input_files.size());

  int id = 0;
  for (const auto &file : input_files) {
    fs::path out = fs::path(output_dir) / fs::path(file).stem();
    out += RECORDING_EXTENSION;
    queue.push({file, out.string(), id++});
  }
  queue.finish();

  std::vector<std::thread> workers;
  for (int i = 0; i < workers_needed; ++i) {
    workers.emplace_back(&BatchFinalizer::worker, this, i, std::ref(queue),
                         std::ref(collector));
  }
  for (auto &w : workers) {
    w.join();
  }

  results_ = collector.extract();

  auto batch_end = std::chrono::steady_clock::now();
  double elapsed_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();
  print_batch_summary(elapsed_sec);

  return static_cast<int>(
      std::count_if(results_.begin(), results_.end(),
                    [](const BatchResult &r) { return !r.success; }));
}

void BatchFinalizer::worker(int worker_id, TaskQueue &queue,
                            ResultCollector &collector) {
  FinalizeTask task;
  while (queue.pop(task)) {
    BatchResult result;
    result.filename = fs::path(task.input_path).filename().string();

    auto start_time = std::chrono::steady_clock::now();
    try {
      RawCapture capture = load_raw_capture_file(task.input_path);
      FinalizeResult finalized = finalize(capture);
      result.frames = finalized.session.frames.size();
      result.keystrokes_retracted = finalized.stats.keystrokes_retracted;
      result.success = save_session_file(task.output_path, finalized.session);
      if (!result.success)
        result.error = "cannot write " + task.output_path;
    } catch (const std::exception &e) {
      result.error = e.what();
    }
    auto end_time = std::chrono::steady_clock::now();
    result.processing_time_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                              start_time)
            .count());

    if (result.success) {
      LOG_SUCCESS("[Job {}] Finalized: {} ({} frames)", worker_id,
                  result.filename, result.frames);
    } else {
      LOG_ERROR("[Job {}] Failed: {} ({})", worker_id, result.filename,
                result.error);
    }
    collector.add(std::move(result));
  }
}

void BatchFinalizer::print_batch_summary(double wall_clock_sec) const {
  int total = static_cast<int>(results_.size());
  int success = 0;
  long total_time_us = 0;
  size_t total_frames = 0;

  for (const auto &result : results_) {
    if (result.success) {
      success++;
      total_frames += result.frames;
    }
    total_time_us += result.processing_time_us;
  }
  int failed = total - success;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "============== BATCH FINALIZE SUMMARY ==============\n");
  fmt::print(stderr, "{:<25} {:>25}\n", "Total files:", total);
  fmt::print(stderr, "{:<25} {:>25}\n", "Successful:", success);
  fmt::print(stderr, "{:<25} {:>25}\n", "Failed:", failed);
  fmt::print(stderr, "{:<25} {:>25}\n", "Frames written:", total_frames);
  fmt::print(stderr, "{:<25} {:>22.3f}s\n", "Wall-clock time:",
             wall_clock_sec);
  fmt::print(stderr, "{:<25} {:>22.3f}s\n", "Sum of file times:",
             total_time_us / 1000000.0);
  fmt::print(stderr, fg(fmt::color::cyan),
             "====================================================\n");

  if (failed > 0) {
    fmt::print(stderr, fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &result : results_) {
      if (!result.success) {
        fmt::print(stderr, fg(fmt::color::red), "  - {}: {}\n",
                   result.filename, result.error);
      }
    }
  }
  std::fflush(stderr);
}

} // namespace term_reel
