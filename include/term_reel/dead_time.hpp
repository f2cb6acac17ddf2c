/**
 * @file dead_time.hpp
 * @brief Dead-time compression of long inactivity gaps
 *
 * @details Gaps longer than the threshold shrink to the cap; the reduction
 *          accumulates, so every later frame moves earlier by the sum of all
 *          earlier reductions. Relative order and short-range rhythm are
 *          untouched.
 *
 * @note Playback-only transform. The stored Session is never modified; the
 *       caller decides whether to discard or export the compressed copy.
 */

#ifndef TERM_REEL_DEAD_TIME_HPP
#define TERM_REEL_DEAD_TIME_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace term_reel {

/**
 * @struct DeadTimePolicy
 * @brief Gap threshold T and cap C in milliseconds. A negative cap acts as 0.
 */
struct DeadTimePolicy {
  int64_t threshold_ms;
  int64_t cap_ms;

  /// Engine defaults (3000 / 1000 unless overridden through Config)
  static DeadTimePolicy defaults();
};

/**
 * @brief Compress dead time in a frame list.
 * @note Input is re-ordered by timestamp first if needed. Lists of 0 or 1
 *       frames are returned unchanged.
 */
std::vector<Frame> compress_dead_time(const std::vector<Frame> &frames,
                                      const DeadTimePolicy &policy);

/**
 * @brief Session overload; metadata is copied untouched.
 */
Session compress_dead_time(const Session &session,
                           const DeadTimePolicy &policy);

/**
 * @brief Total milliseconds the policy would remove from the frame list.
 */
int64_t dead_time_removed(const std::vector<Frame> &frames,
                          const DeadTimePolicy &policy);

} // namespace term_reel

#endif // TERM_REEL_DEAD_TIME_HPP
