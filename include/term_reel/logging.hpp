/**
 * @file logging.hpp
 * @brief Diagnostics for the term_reel engine and CLI
 *
 * @details Log lines and phase timings both go to stderr. stdout belongs to
 *          playback, so nothing here ever writes there.
 */

#ifndef TERM_REEL_LOGGING_HPP
#define TERM_REEL_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace term_reel {

// **----- LOGGING CONFIGURATION -----**

/// Build with -DENABLE_LOGGING=0 or -DENABLE_TIMING=0 to compile either out
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Serializes log lines from batch workers
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(term_reel::log_mutex);                    \
    fmt::print(stderr, "[INFO] " format_str "\n", ##__VA_ARGS__);              \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(term_reel::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::yellow), "[WARN] " format_str "\n",      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(term_reel::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::red), "[ERROR] " format_str "\n",        \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(term_reel::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);  \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(term_reel::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::green), format_str "\n", ##__VA_ARGS__); \
    std::fflush(stderr);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/// One measured run of an engine phase such as load_session or finalize
struct TimingEntry {
  std::string name;
  long microseconds;
};

/**
 * @class TimingCollector
 * @brief Process-wide record of phase timings.
 * @note A batch repeats each phase once per file, so the summary folds
 *       entries with the same name into one row.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /// Per-phase run count, total and slowest run, in first-seen order
  static void print_summary();

  static void clear();

  static std::vector<TimingEntry> snapshot();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    term_reel::TimingCollector::record(#name,                                  \
                                       static_cast<long>(timer_duration_##name)); \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace term_reel

#endif // TERM_REEL_LOGGING_HPP
