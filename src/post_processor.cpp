/**
 * @file post_processor.cpp
 * @brief Capture post-processing implementation
 */

#include "term_reel/post_processor.hpp"

#include <cctype>
#include <utility>

#include "term_reel/logging.hpp"
#include "term_reel/session.hpp"

namespace term_reel {

namespace {

constexpr char BS = 0x08;
constexpr char DEL = 0x7F;
constexpr char ESC = 0x1B;

/// Length of ESC[K at pos, or 0
size_t erase_line_length(std::string_view s, size_t pos) {
  if (pos + 2 < s.size() && s[pos] == ESC && s[pos + 1] == '[' &&
      s[pos + 2] == 'K')
    return 3;
  return 0;
}

/// Length of ESC[<digits>D at pos, or 0. The digits may be absent.
size_t cursor_left_length(std::string_view s, size_t pos) {
  if (pos + 2 >= s.size() || s[pos] != ESC || s[pos + 1] != '[')
    return 0;
  size_t j = pos + 2;
  while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j])))
    ++j;
  if (j < s.size() && s[j] == 'D')
    return j + 1 - pos;
  return 0;
}

/**
 * @brief One left-to-right removal pass over s.
 * @param match Returns the length of the sequence to drop at a position, or 0.
 */
template <typename Match>
std::string remove_matches(std::string_view s, Match match) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    size_t len = match(s, i);
    if (len > 0) {
      i += len;
      continue;
    }
    out += s[i];
    ++i;
  }
  return out;
}

} // namespace

// **---- Artifact Filtering ----**

std::string strip_capture_artifacts(std::string_view content) {
  /// Each pass sees the output of the one before, so removing a byte can
  /// join the pieces of an escape sequence that the next pass then drops
  std::string clean = remove_matches(content, [](std::string_view s,
                                                 size_t pos) -> size_t {
    return (s[pos] == BS || s[pos] == DEL) ? 1 : 0;
  });
  clean = remove_matches(clean, erase_line_length);
  clean = remove_matches(clean, cursor_left_length);
  return clean;
}

// **---- Marker Processing ----**

std::vector<Frame> clean_frames(const std::vector<Frame> &raw,
                                FinalizeStats *stats) {
  FinalizeStats local;

  std::vector<Frame> result;
  result.reserve(raw.size());
  std::vector<char> retracted;
  retracted.reserve(raw.size());

  /// Indices into result of Input frames not yet corrected, newest last
  std::vector<size_t> pending;

  for (const auto &frame : raw) {
    switch (frame.kind) {
    case FrameKind::Output: {
      std::string clean = strip_capture_artifacts(frame.content);
      if (clean.empty() && !frame.content.empty()) {
        ++local.artifact_frames_dropped;
        break;
      }
      result.push_back(make_output(frame.timestamp, std::move(clean)));
      retracted.push_back(0);
      break;
    }
    case FrameKind::Input:
      pending.push_back(result.size());
      result.push_back(frame);
      retracted.push_back(0);
      break;
    case FrameKind::CorrectionMarker:
      if (pending.empty()) {
        ++local.unmatched_markers;
        break;
      }
      retracted[pending.back()] = 1;
      pending.pop_back();
      ++local.keystrokes_retracted;
      break;
    }
  }

  /// Compact in place, dropping retracted keystrokes
  size_t out = 0;
  for (size_t i = 0; i < result.size(); ++i) {
    if (retracted[i])
      continue;
    if (result[i].kind == FrameKind::Input)
      ++local.keystrokes_kept;
    if (out != i)
      result[out] = std::move(result[i]);
    ++out;
  }
  result.resize(out);

  sort_by_timestamp(result);

  if (stats)
    *stats = local;
  return result;
}

// **---- Finalization ----**

FinalizeResult finalize(const RawCapture &capture) {
  TIMER_START(finalize);

  FinalizeResult out;
  out.session.format_version = CURRENT_FORMAT_VERSION;
  out.session.start_time = capture.start_time;
  out.session.end_time = capture.end_time;
  out.session.terminal_info = capture.terminal_info;
  if (capture.dimensions) {
    out.session.dimensions = normalize_dimensions(capture.dimensions->width,
                                                  capture.dimensions->height);
  }
  out.session.frames = clean_frames(to_raw_frames(capture.events), &out.stats);

  if (out.stats.unmatched_markers > 0) {
    LOG_WARN("Ignored {} correction marker(s) with no pending keystroke",
             out.stats.unmatched_markers);
  }
  if (out.stats.artifact_frames_dropped > 0) {
    LOG_INFO("Dropped {} output frame(s) containing only correction noise",
             out.stats.artifact_frames_dropped);
  }

  TIMER_END(finalize);
  return out;
}

} // namespace term_reel
