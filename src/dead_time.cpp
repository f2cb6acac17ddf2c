/**
 * @file dead_time.cpp
 * @brief Dead-time compression implementation
 */

#include "term_reel/dead_time.hpp"

#include <algorithm>
#include <utility>

#include "term_reel/config.hpp"
#include "term_reel/session.hpp"

namespace term_reel {

DeadTimePolicy DeadTimePolicy::defaults() {
  return DeadTimePolicy{Config::dead_time_threshold_ms(),
                        std::max<int64_t>(0, Config::dead_time_cap_ms())};
}

std::vector<Frame> compress_dead_time(const std::vector<Frame> &frames,
                                      const DeadTimePolicy &policy) {
  if (frames.size() <= 1)
    return frames;

  /// A gap never shrinks below zero, whatever the caller asked for
  const int64_t cap_ms = std::max<int64_t>(0, policy.cap_ms);

  std::vector<Frame> ordered = frames;
  sort_by_timestamp(ordered);

  std::vector<Frame> compressed;
  compressed.reserve(ordered.size());

  int64_t reduction = 0;
  for (size_t i = 0; i < ordered.size(); ++i) {
    Frame adjusted = ordered[i];
    adjusted.timestamp -= reduction;
    compressed.push_back(std::move(adjusted));

    if (i + 1 < ordered.size()) {
      int64_t gap = ordered[i + 1].timestamp - ordered[i].timestamp;
      if (gap > policy.threshold_ms && gap > cap_ms) {
        reduction += gap - cap_ms;
      }
    }
  }
  return compressed;
}

Session compress_dead_time(const Session &session,
                           const DeadTimePolicy &policy) {
  Session compressed = session;
  compressed.frames = compress_dead_time(session.frames, policy);
  return compressed;
}

int64_t dead_time_removed(const std::vector<Frame> &frames,
                          const DeadTimePolicy &policy) {
  if (frames.size() <= 1)
    return 0;
  std::vector<Frame> compressed = compress_dead_time(frames, policy);
  int64_t before = 0;
  for (const auto &f : frames)
    before = std::max(before, f.timestamp);
  return before - compressed.back().timestamp;
}

} // namespace term_reel
