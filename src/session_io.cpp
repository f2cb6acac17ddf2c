/**
 * @file session_io.cpp
 * @brief Persisted session format implementation
 */

#include "term_reel/session_io.hpp"

#include <cmath>
#include <cstdint>
#include <ctime>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "term_reel/errors.hpp"
#include "term_reel/logging.hpp"
#include "term_reel/memory_io.hpp"
#include "term_reel/session.hpp"

namespace term_reel {

using json = nlohmann::json;

namespace {

/// Dump settings shared by every writer; invalid UTF-8 is replaced
std::string dump_document(const json &document) {
  return document.dump(2, ' ', false, json::error_handler_t::replace);
}

// **---- Field Readers ----**

const json &require(const json &object, const char *key,
                    const std::string &path) {
  auto it = object.find(key);
  if (it == object.end()) {
    throw MalformedDocument(path, "required field is missing");
  }
  return *it;
}

int64_t read_millis(const json &value, const std::string &path) {
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw MalformedDocument(path, "out of range");
  }
  if (value.is_number_integer()) {
    return value.get<int64_t>();
  }
  if (value.is_number_float()) {
    double d = value.get<double>();
    if (!std::isfinite(d)) {
      throw MalformedDocument(path, "expected a finite number");
    }
    /// 2^63 is exact as a double; anything at or past it overflows int64_t
    constexpr double limit = 9223372036854775808.0;
    if (d >= limit || d < -limit) {
      throw MalformedDocument(path, "out of range");
    }
    return std::llround(d);
  }
  throw MalformedDocument(path, "expected a number");
}

std::optional<std::string> read_optional_string(const json &object,
                                                const char *key,
                                                const std::string &path) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null())
    return std::nullopt;
  if (!it->is_string()) {
    throw MalformedDocument(path + "." + key, "expected a string");
  }
  return it->get<std::string>();
}

std::string read_version(const json &document) {
  auto it = document.find("formatVersion");
  if (it == document.end()) {
    /// Recordings written before the field was renamed
    it = document.find("version");
  }
  if (it == document.end()) {
    throw MalformedDocument("formatVersion", "required field is missing");
  }
  if (!it->is_string()) {
    throw MalformedDocument("formatVersion", "expected a string");
  }
  return it->get<std::string>();
}

FrameKind read_kind(const json &value, const std::string &path,
                    bool allow_markers) {
  if (!value.is_string()) {
    throw MalformedDocument(path, "expected a string");
  }
  const auto &type = value.get_ref<const std::string &>();
  if (type == "input")
    return FrameKind::Input;
  if (type == "output")
    return FrameKind::Output;
  if (allow_markers && type == "correction")
    return FrameKind::CorrectionMarker;
  throw MalformedDocument(path, "unknown frame type '" + type + "'");
}

std::vector<Frame> read_frames(const json &document, bool allow_markers) {
  const json &frames = require(document, "frames", "frames");
  if (!frames.is_array()) {
    throw MalformedDocument("frames", "expected an array");
  }

  std::vector<Frame> out;
  out.reserve(frames.size());
  for (size_t i = 0; i < frames.size(); ++i) {
    const std::string path = fmt::format("frames[{}]", i);
    const json &f = frames[i];
    if (!f.is_object()) {
      throw MalformedDocument(path, "expected an object");
    }

    Frame frame;
    frame.timestamp =
        read_millis(require(f, "timestamp", path + ".timestamp"),
                    path + ".timestamp");
    if (frame.timestamp < 0) {
      throw MalformedDocument(path + ".timestamp", "negative timestamp");
    }

    const json &content = require(f, "content", path + ".content");
    if (!content.is_string()) {
      throw MalformedDocument(path + ".content", "expected a string");
    }
    frame.content = content.get<std::string>();
    frame.kind = read_kind(require(f, "type", path + ".type"), path + ".type",
                           allow_markers);
    out.push_back(std::move(frame));
  }
  return out;
}

TerminalInfo read_terminal_info(const json &document) {
  const json &info = require(document, "terminalInfo", "terminalInfo");
  if (!info.is_object()) {
    throw MalformedDocument("terminalInfo", "expected an object");
  }
  TerminalInfo out;
  out.name = read_optional_string(info, "name", "terminalInfo");
  out.cwd = read_optional_string(info, "cwd", "terminalInfo");
  out.shell_path = read_optional_string(info, "shellPath", "terminalInfo");
  return out;
}

std::optional<Dimensions> read_dimensions(const json &document) {
  auto it = document.find("dimensions");
  if (it == document.end() || it->is_null())
    return std::nullopt;
  if (!it->is_object()) {
    throw MalformedDocument("dimensions", "expected an object");
  }
  int64_t width = read_millis(require(*it, "width", "dimensions.width"),
                              "dimensions.width");
  int64_t height = read_millis(require(*it, "height", "dimensions.height"),
                               "dimensions.height");
  /// Out-of-range grids fall back to defaults rather than failing
  auto narrow = [](int64_t v) {
    return (v > 0 && v < 100000) ? static_cast<int>(v) : 0;
  };
  return normalize_dimensions(narrow(width), narrow(height));
}

/// Shared header of session and raw capture documents
struct DocumentHeader {
  std::string version;
  int64_t start_time = 0;
  std::optional<int64_t> end_time;
};

DocumentHeader read_header(const json &document) {
  if (!document.is_object()) {
    throw MalformedDocument("document", "expected a JSON object");
  }

  DocumentHeader header;
  header.version = read_version(document);
  check_format_version(header.version);

  header.start_time =
      read_millis(require(document, "startTime", "startTime"), "startTime");
  auto end = document.find("endTime");
  if (end != document.end() && !end->is_null()) {
    header.end_time = read_millis(*end, "endTime");
  }
  return header;
}

json parse_document(std::string_view text) {
  try {
    return json::parse(text.begin(), text.end());
  } catch (const json::parse_error &e) {
    throw MalformedDocument("document", e.what());
  }
}

json raw_frame_to_json(const Frame &frame) {
  json j;
  j["timestamp"] = frame.timestamp;
  j["content"] = frame.content;
  j["type"] = frame.kind == FrameKind::CorrectionMarker
                  ? "correction"
                  : to_string(frame.kind);
  return j;
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    tp.time_since_epoch())
                    .count();
  std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(seconds),
                     static_cast<int>(millis % 1000));
}

} // namespace

// **---- nlohmann ADL hooks ----**

void to_json(json &j, const Frame &frame) { j = raw_frame_to_json(frame); }

void to_json(json &j, const Dimensions &dims) {
  j = json{{"width", dims.width}, {"height", dims.height}};
}

void to_json(json &j, const TerminalInfo &info) {
  j = json::object();
  if (info.name)
    j["name"] = *info.name;
  if (info.cwd)
    j["cwd"] = *info.cwd;
  if (info.shell_path)
    j["shellPath"] = *info.shell_path;
}

void to_json(json &j, const Session &session) {
  j = json::object();
  j["formatVersion"] = session.format_version;
  j["startTime"] = session.start_time;
  if (session.end_time)
    j["endTime"] = *session.end_time;
  j["frames"] = session.frames;
  j["terminalInfo"] = session.terminal_info;
  if (session.dimensions)
    j["dimensions"] = *session.dimensions;
}

void from_json(const json &j, Session &session) {
  session = session_from_json(j);
}

// **---- Sessions ----**

Session session_from_json(const json &document) {
  DocumentHeader header = read_header(document);

  Session session;
  session.format_version = std::move(header.version);
  session.start_time = header.start_time;
  session.end_time = header.end_time;
  session.frames = read_frames(document, false);
  session.terminal_info = read_terminal_info(document);
  session.dimensions = read_dimensions(document);
  return session;
}

Session load_session(std::string_view text) {
  return session_from_json(parse_document(text));
}

std::string save_session(const Session &session) {
  return dump_document(json(session));
}

Session load_session_file(const std::string &path) {
  TIMER_START(load_session);
  MappedFile file;
  if (!MemoryLoader::load_file(path, file)) {
    throw MalformedDocument("document", "cannot read " + path);
  }
  Session session = load_session(file.view());
  TIMER_END(load_session);
  return session;
}

bool save_session_file(const std::string &path, const Session &session) {
  TIMER_START(save_session);
  bool ok = MemoryLoader::write_file(path, save_session(session));
  TIMER_END(save_session);
  return ok;
}

std::string export_session(const Session &session,
                           std::chrono::system_clock::time_point exported_at) {
  json document = session;
  document["exportInfo"] = json{{"exportedAt", iso8601_utc(exported_at)},
                                {"exportedBy", "term_reel"},
                                {"version", session.format_version}};
  return dump_document(document);
}

// **---- Raw Captures ----**

RawCapture load_raw_capture(std::string_view text) {
  json document = parse_document(text);
  DocumentHeader header = read_header(document);

  RawCapture capture;
  capture.start_time = header.start_time;
  capture.end_time = header.end_time;
  capture.events =
      from_raw_frames(decode_legacy_markers(read_frames(document, true)));
  capture.terminal_info = read_terminal_info(document);
  capture.dimensions = read_dimensions(document);
  return capture;
}

RawCapture load_raw_capture_file(const std::string &path) {
  MappedFile file;
  if (!MemoryLoader::load_file(path, file)) {
    throw MalformedDocument("document", "cannot read " + path);
  }
  return load_raw_capture(file.view());
}

std::string save_raw_capture(const RawCapture &capture) {
  json document = json::object();
  document["formatVersion"] = CURRENT_FORMAT_VERSION;
  document["startTime"] = capture.start_time;
  if (capture.end_time)
    document["endTime"] = *capture.end_time;
  document["frames"] = to_raw_frames(capture.events);
  document["terminalInfo"] = capture.terminal_info;
  if (capture.dimensions)
    document["dimensions"] = *capture.dimensions;
  return dump_document(document);
}

} // namespace term_reel
