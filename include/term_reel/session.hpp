/**
 * @file session.hpp
 * @brief Frame and Session helpers
 *
 * @details Provides:
 *          - Frame constructors
 *
 *          - duration() and the session summary used by `term_reel info`
 *
 *          - Dimension normalisation
 *
 *          - Format version gating
 *
 *          - Stable timestamp ordering
 */

#ifndef TERM_REEL_SESSION_HPP
#define TERM_REEL_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace term_reel {

// **---- Frame Constructors ----**

Frame make_input(int64_t timestamp, std::string content);
Frame make_output(int64_t timestamp, std::string content);
Frame make_marker(int64_t timestamp);

const char *to_string(FrameKind kind);

// **---- Session Accessors ----**

/**
 * @brief Session length in milliseconds.
 * @return endTime - startTime when both anchors exist, else the last frame's
 *         timestamp, else 0
 */
int64_t duration(const Session &session);

/**
 * @brief Dimensions with the {80, 24} default applied when absent.
 */
Dimensions effective_dimensions(const Session &session);

/**
 * @brief Clamp a requested grid to the supported range.
 * @note Each field falls back to its own default independently.
 */
Dimensions normalize_dimensions(int width, int height);

/**
 * @brief Extract the major component of a "MAJOR.MINOR[.PATCH]" string.
 * @throws MalformedDocument when no leading integer is present
 */
int parse_major_version(const std::string &version);

/**
 * @brief Reject versions whose major component differs from ours.
 * @throws IncompatibleFormat on a mismatch
 * @throws MalformedDocument when the string has no major component
 */
void check_format_version(const std::string &version);

/**
 * @brief True when timestamps never decrease along the frame list.
 */
bool is_time_ordered(const std::vector<Frame> &frames);

/**
 * @brief Restore non-decreasing timestamp order.
 * @note Stable: frames sharing a timestamp keep their capture order.
 */
void sort_by_timestamp(std::vector<Frame> &frames);

/**
 * @brief True when no CorrectionMarker frame is present.
 */
bool is_finalized(const Session &session);

// **---- Summary ----**

/**
 * @struct SessionSummary
 * @brief Figures shown by `term_reel info`.
 */
struct SessionSummary {
  int64_t duration_ms = 0;
  size_t frame_count = 0;
  size_t input_frames = 0;
  size_t output_frames = 0;
  size_t command_count = 0; //< Enter keystrokes
  Dimensions dimensions;
};

SessionSummary summarize(const Session &session);

} // namespace term_reel

#endif // TERM_REEL_SESSION_HPP
