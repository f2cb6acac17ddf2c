/**
 * @file timeline_editor.cpp
 * @brief Value-semantics Session edits implementation
 */

#include "term_reel/timeline_editor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "term_reel/logging.hpp"
#include "term_reel/session.hpp"

namespace term_reel {

namespace {

/// Values beyond this are treated as garbage input
constexpr int MAX_DIMENSION = 10000;

} // namespace

// **---- Resize ----**

int parse_dimension(std::string_view text, int fallback) {
  size_t i = 0;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
    ++i;

  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }

  int value = 0;
  bool digits = false;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    value = value * 10 + (text[i] - '0');
    digits = true;
    if (value > MAX_DIMENSION)
      return fallback;
    ++i;
  }

  if (!digits || value == 0)
    return fallback;
  return negative ? -value : value;
}

Session resize(const Session &session, int width, int height) {
  Session edited = session;
  Dimensions dims = normalize_dimensions(width, height);
  if (dims.width != width || dims.height != height) {
    LOG_WARN("Requested size {}x{} out of range, using {}x{}", width, height,
             dims.width, dims.height);
  }
  edited.dimensions = dims;
  return edited;
}

Session resize(const Session &session, const ResizeRequest &request) {
  return resize(session, parse_dimension(request.width, DEFAULT_WIDTH),
                parse_dimension(request.height, DEFAULT_HEIGHT));
}

// **---- Trim ----**

Session trim(const Session &session, const TrimRequest &request) {
  const int64_t start_ms = std::max<int64_t>(0, request.start_ms);

  Session edited;
  edited.format_version = session.format_version;
  edited.terminal_info = session.terminal_info;
  edited.dimensions = session.dimensions;
  edited.start_time = session.start_time + start_ms;
  edited.end_time = session.end_time;
  if (session.end_time && request.end_ms) {
    edited.end_time =
        std::min(*session.end_time, session.start_time + *request.end_ms);
  }

  std::vector<Frame> ordered = session.frames;
  sort_by_timestamp(ordered);

  for (auto &f : ordered) {
    if (f.timestamp < start_ms)
      continue;
    if (request.end_ms && f.timestamp > *request.end_ms)
      break;
    edited.frames.push_back(std::move(f));
  }

  if (!edited.frames.empty()) {
    const int64_t base = edited.frames.front().timestamp;
    for (auto &f : edited.frames) {
      f.timestamp -= base;
    }
  }

  return edited;
}

// **---- Retime ----**

Session retime(const Session &session, double factor) {
  if (!(factor > 0.0) || !std::isfinite(factor)) {
    LOG_WARN("Ignoring retime factor {}", factor);
    return session;
  }

  Session edited = session;
  for (auto &f : edited.frames) {
    f.timestamp = std::llround(static_cast<double>(f.timestamp) / factor);
  }
  if (edited.end_time) {
    double span = static_cast<double>(*edited.end_time - edited.start_time);
    edited.end_time = edited.start_time + std::llround(span / factor);
  }
  return edited;
}

// **---- Combined ----**

Session apply_edits(const Session &session, const EditRequest &edits) {
  Session edited = session;
  if (edits.resize) {
    edited = resize(edited, *edits.resize);
  }
  if (edits.trim) {
    edited = trim(edited, *edits.trim);
  }
  return edited;
}

} // namespace term_reel
