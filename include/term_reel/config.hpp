/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          engine defaults loaded from environment variables. Algorithms
 *          never read these directly: they take DeadTimePolicy /
 *          PlaybackOptions structs whose defaults come from here.
 *
 */

#ifndef TERM_REEL_CONFIG_HPP
#define TERM_REEL_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace term_reel {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/// Inactivity gap (ms) above which dead-time compression kicks in
inline int64_t dead_time_threshold_ms() {
  static int64_t val = get_env_int("DEAD_TIME_THRESHOLD_MS", 3000);
  return val;
}

/// Length (ms) a compressed gap is shortened to
inline int64_t dead_time_cap_ms() {
  static int64_t val = get_env_int("DEAD_TIME_CAP_MS", 1000);
  return val;
}

/**
 * @brief Floor (ms) for the delay between two emitted frames.
 * @note Keeps near-simultaneous frames from firing as a burst.
 */
inline int64_t min_frame_delay_ms() {
  static int64_t val = get_env_int("MIN_FRAME_DELAY_MS", 50);
  return val;
}

/// Default playback rate for `term_reel play` (1.0 = real time)
inline double playback_speed() {
  static double val = get_env_double("PLAYBACK_SPEED", 1.0);
  return val;
}

/**
 * @brief Worker threads for batch finalize
 * @note 0 = one per hardware thread
 */
inline int parallel_jobs() {
  static int val = get_env_int("PARALLEL_JOBS", 0);
  return val;
}

} // namespace Config
} // namespace term_reel

#endif // TERM_REEL_CONFIG_HPP
