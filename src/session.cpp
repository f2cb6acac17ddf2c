/**
 * @file session.cpp
 * @brief Frame and Session helpers implementation
 */

#include "term_reel/session.hpp"

#include <algorithm>
#include <cctype>

#include "term_reel/errors.hpp"

namespace term_reel {

// **---- Equality ----**

bool operator==(const Frame &a, const Frame &b) {
  return a.timestamp == b.timestamp && a.kind == b.kind &&
         a.content == b.content;
}

bool operator!=(const Frame &a, const Frame &b) { return !(a == b); }

bool operator==(const Dimensions &a, const Dimensions &b) {
  return a.width == b.width && a.height == b.height;
}

bool operator!=(const Dimensions &a, const Dimensions &b) { return !(a == b); }

bool operator==(const TerminalInfo &a, const TerminalInfo &b) {
  return a.name == b.name && a.cwd == b.cwd && a.shell_path == b.shell_path;
}

bool operator!=(const TerminalInfo &a, const TerminalInfo &b) {
  return !(a == b);
}

bool operator==(const Session &a, const Session &b) {
  return a.format_version == b.format_version &&
         a.start_time == b.start_time && a.end_time == b.end_time &&
         a.frames == b.frames && a.terminal_info == b.terminal_info &&
         a.dimensions == b.dimensions;
}

bool operator!=(const Session &a, const Session &b) { return !(a == b); }

// **---- Frame Constructors ----**

Frame make_input(int64_t timestamp, std::string content) {
  return Frame{timestamp, std::move(content), FrameKind::Input};
}

Frame make_output(int64_t timestamp, std::string content) {
  return Frame{timestamp, std::move(content), FrameKind::Output};
}

Frame make_marker(int64_t timestamp) {
  return Frame{timestamp, std::string(), FrameKind::CorrectionMarker};
}

const char *to_string(FrameKind kind) {
  switch (kind) {
  case FrameKind::Input:
    return "input";
  case FrameKind::Output:
    return "output";
  case FrameKind::CorrectionMarker:
    return "correction";
  }
  return "unknown";
}

// **---- Session Accessors ----**

int64_t duration(const Session &session) {
  if (session.end_time) {
    return *session.end_time - session.start_time;
  }
  if (!session.frames.empty()) {
    return session.frames.back().timestamp;
  }
  return 0;
}

Dimensions effective_dimensions(const Session &session) {
  return session.dimensions.value_or(Dimensions{});
}

Dimensions normalize_dimensions(int width, int height) {
  Dimensions dims;
  dims.width = width >= MIN_WIDTH ? width : DEFAULT_WIDTH;
  dims.height = height >= MIN_HEIGHT ? height : DEFAULT_HEIGHT;
  return dims;
}

int parse_major_version(const std::string &version) {
  size_t i = 0;
  int major = 0;
  bool digits = false;
  while (i < version.size() &&
         std::isdigit(static_cast<unsigned char>(version[i]))) {
    if (major > 100000) {
      throw MalformedDocument("formatVersion",
                              "major version out of range: " + version);
    }
    major = major * 10 + (version[i] - '0');
    digits = true;
    ++i;
  }
  if (!digits || (i < version.size() && version[i] != '.')) {
    throw MalformedDocument("formatVersion",
                            "expected MAJOR.MINOR, got '" + version + "'");
  }
  return major;
}

void check_format_version(const std::string &version) {
  if (parse_major_version(version) != SUPPORTED_FORMAT_MAJOR) {
    throw IncompatibleFormat(version, SUPPORTED_FORMAT_MAJOR);
  }
}

bool is_time_ordered(const std::vector<Frame> &frames) {
  return std::is_sorted(frames.begin(), frames.end(),
                        [](const Frame &a, const Frame &b) {
                          return a.timestamp < b.timestamp;
                        });
}

void sort_by_timestamp(std::vector<Frame> &frames) {
  if (is_time_ordered(frames))
    return;
  std::stable_sort(frames.begin(), frames.end(),
                   [](const Frame &a, const Frame &b) {
                     return a.timestamp < b.timestamp;
                   });
}

bool is_finalized(const Session &session) {
  return std::none_of(session.frames.begin(), session.frames.end(),
                      [](const Frame &f) {
                        return f.kind == FrameKind::CorrectionMarker;
                      });
}

// **---- Summary ----**

SessionSummary summarize(const Session &session) {
  SessionSummary summary;
  summary.duration_ms = duration(session);
  summary.frame_count = session.frames.size();
  summary.dimensions = effective_dimensions(session);
  for (const auto &f : session.frames) {
    if (f.kind == FrameKind::Input) {
      ++summary.input_frames;
      if (f.content == "\r\n")
        ++summary.command_count;
    } else if (f.kind == FrameKind::Output) {
      ++summary.output_frames;
    }
  }
  return summary;
}

} // namespace term_reel
