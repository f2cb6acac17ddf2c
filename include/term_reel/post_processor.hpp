/**
 * @file post_processor.hpp
 * @brief Capture post-processing: raw capture -> finalized Session
 *
 * @details The live recording keeps authentic per-keystroke timing,
 *          corrections included. Finalization removes the artifacts once,
 *          at stop time:
 *
 *          1. Output frames are stripped of capture-artifact control bytes
 *
 *          2. Input frames are kept and pushed on a pending stack
 *
 *          3. Each correction marker pops the newest pending Input frame
 *             and removes that frame from the result
 *
 *          4. The result is stably re-ordered by timestamp
 *
 * @note Pure and total: malformed marker sequences are no-ops, never errors.
 */

#ifndef TERM_REEL_POST_PROCESSOR_HPP
#define TERM_REEL_POST_PROCESSOR_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "capture.hpp"
#include "types.hpp"

namespace term_reel {

/**
 * @struct FinalizeStats
 * @brief What finalization removed.
 */
struct FinalizeStats {
  size_t keystrokes_kept = 0;
  size_t keystrokes_retracted = 0;
  size_t unmatched_markers = 0;       //< Markers with no pending Input frame
  size_t artifact_frames_dropped = 0; //< Output frames that were only noise
};

/**
 * @struct FinalizeResult
 * @brief The finalized Session and its statistics.
 */
struct FinalizeResult {
  Session session;
  FinalizeStats stats;
};

/**
 * @brief Remove terminal-driven correction noise from output text.
 *
 * @note Strips BS (0x08), DEL (0x7F), ESC[K, ESC[D and ESC[<n>D. Every other
 *       escape sequence passes through untouched.
 */
std::string strip_capture_artifacts(std::string_view content);

/**
 * @brief Apply correction markers and artifact filtering to raw frames.
 * @param raw Frames in capture order (any kind, markers included)
 * @param stats Optional output statistics
 * @return Frames containing only Input and Output kinds, time-ordered
 */
std::vector<Frame> clean_frames(const std::vector<Frame> &raw,
                                FinalizeStats *stats = nullptr);

/**
 * @brief Finalize a raw capture into a storable Session.
 * @note The returned Session is stamped with CURRENT_FORMAT_VERSION.
 */
FinalizeResult finalize(const RawCapture &capture);

} // namespace term_reel

#endif // TERM_REEL_POST_PROCESSOR_HPP
