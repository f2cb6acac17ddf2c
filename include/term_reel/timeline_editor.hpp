/**
 * @file timeline_editor.hpp
 * @brief Value-semantics edits over a Session
 *
 * @details Every edit takes the source Session by const reference and
 *          returns a new one, so the original stays recoverable for the
 *          preview-before-save workflow:
 *
 *          - resize: replace dimensions (never rejects input)
 *
 *          - trim: keep a time window and re-base it to zero
 *
 *          - retime: rescale the timeline by a speed factor
 *
 *          - apply_edits: resize and/or trim from a host form request
 *
 * @note resize touches only dimensions and trim only frames/anchors, so the
 *       two commute.
 */

#ifndef TERM_REEL_TIMELINE_EDITOR_HPP
#define TERM_REEL_TIMELINE_EDITOR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace term_reel {

/**
 * @struct ResizeRequest
 * @brief Width/height exactly as the host form supplied them.
 */
struct ResizeRequest {
  std::string width;
  std::string height;
};

/**
 * @struct TrimRequest
 * @brief Session-relative window [start_ms, end_ms]; no end = unbounded.
 */
struct TrimRequest {
  int64_t start_ms = 0;
  std::optional<int64_t> end_ms;
};

/**
 * @struct EditRequest
 * @brief A bundle of optional edits.
 */
struct EditRequest {
  std::optional<ResizeRequest> resize;
  std::optional<TrimRequest> trim;
};

/**
 * @brief Integer-prefix parse of a dimension field.
 * @note "132cols" -> 132. No digits, zero, or overflow yields fallback.
 */
int parse_dimension(std::string_view text, int fallback);

Session resize(const Session &session, int width, int height);
Session resize(const Session &session, const ResizeRequest &request);

/**
 * @brief Keep frames with start_ms <= timestamp <= end_ms.
 *
 * @attention RESULT:
 *
 * - Retained timestamps are re-based so the first one becomes 0
 *
 * - startTime moves forward by start_ms
 *
 * - endTime is clamped to startTime + end_ms when both exist
 *
 * - An empty window yields a Session with zero frames
 */
Session trim(const Session &session, const TrimRequest &request);

/**
 * @brief Play back `factor` times faster (0.5 = twice as slow).
 * @note Non-positive or non-finite factors return an unchanged copy.
 */
Session retime(const Session &session, double factor);

/**
 * @brief Apply the requested edits, resize first.
 */
Session apply_edits(const Session &session, const EditRequest &edits);

} // namespace term_reel

#endif // TERM_REEL_TIMELINE_EDITOR_HPP
