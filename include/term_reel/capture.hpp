/**
 * @file capture.hpp
 * @brief Raw capture events and the recording line discipline
 *
 * @details Provides:
 *          - CaptureEvent: closed variant Keystroke | Deletion | Flush
 *
 *          - RawCapture: the event stream plus session metadata, as handed
 *            to the post-processor once capture has ended
 *
 *          - CaptureRecorder: turns terminal key bytes and shell output
 *            chunks into timestamped capture events
 *
 * @note Spawning the shell and piping its streams belongs to the host. The
 *       recorder only sees bytes.
 */

#ifndef TERM_REEL_CAPTURE_HPP
#define TERM_REEL_CAPTURE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "types.hpp"

namespace term_reel {

/// Content value early recorders stored in an Input frame to mean "delete".
constexpr const char *LEGACY_BACKSPACE_SENTINEL = "[BACKSPACE]";

// **----- CAPTURE EVENTS -----**

/// A keystroke the user typed (or "\r\n" for Enter).
struct Keystroke {
  int64_t timestamp;
  std::string content;
};

/// Retraction of the most recent keystroke.
struct Deletion {
  int64_t timestamp;
};

/// A chunk of shell output (stdout or stderr).
struct Flush {
  int64_t timestamp;
  std::string content;
};

using CaptureEvent = std::variant<Keystroke, Deletion, Flush>;

/**
 * @struct RawCapture
 * @brief Everything the capture source produced for one session.
 * @note end_time is set by the "session ended" signal.
 */
struct RawCapture {
  int64_t start_time = 0;
  std::optional<int64_t> end_time;
  std::vector<CaptureEvent> events;
  TerminalInfo terminal_info;
  std::optional<Dimensions> dimensions;
};

/**
 * @brief Lower capture events to raw frames.
 * @note Keystroke -> Input, Deletion -> CorrectionMarker, Flush -> Output.
 */
std::vector<Frame> to_raw_frames(const std::vector<CaptureEvent> &events);

/**
 * @brief Convert legacy "[BACKSPACE]" Input frames to CorrectionMarker.
 */
std::vector<Frame> decode_legacy_markers(std::vector<Frame> frames);

/**
 * @brief Lift raw frames back into capture events.
 * @note Used when a raw capture was stored as a frame list.
 */
std::vector<CaptureEvent> from_raw_frames(const std::vector<Frame> &frames);

// **----- CAPTURE RECORDER -----**

/**
 * @class CaptureRecorder
 * @brief Line discipline sitting between the user's keyboard and the shell.
 *
 * @attention INPUT HANDLING (per byte):
 *
 * - Printable ASCII (32..126): appended to the line, recorded as Keystroke
 *
 * - BS (8) / DEL (127): recorded as Deletion only if the line is non-empty
 *
 * - CR (13): recorded as Keystroke "\r\n", the line goes to the command sink
 *
 * - Anything else: ignored
 *
 * @note Not thread-safe. The host serialises input and output callbacks.
 */
class CaptureRecorder {
public:
  using Clock = std::function<int64_t()>;
  using CommandSink = std::function<void(const std::string &)>;

  /**
   * @param clock Returns wall-clock epoch milliseconds
   * @param terminal_info Metadata copied into the session
   */
  CaptureRecorder(Clock clock, TerminalInfo terminal_info);

  /**
   * @brief Receive completed command lines (what the shell's stdin gets).
   */
  void set_command_sink(CommandSink sink) { command_sink_ = std::move(sink); }

  /// Begin recording; the start time is taken from the clock.
  void start();

  /**
   * @brief Feed bytes typed by the user.
   * @return Bytes to echo to the live terminal
   */
  std::string feed_input(std::string_view bytes);

  /// Feed a chunk of shell output.
  void feed_output(std::string_view chunk);

  /**
   * @brief Signal "session ended" and hand over the capture.
   * @note Further input/output is ignored until start() is called again.
   */
  RawCapture stop();

  bool is_recording() const { return recording_; }
  const std::string &line_buffer() const { return line_; }
  size_t event_count() const { return capture_.events.size(); }

private:
  int64_t elapsed();

  Clock clock_;
  CommandSink command_sink_;
  TerminalInfo terminal_info_;
  RawCapture capture_;
  std::string line_;
  bool recording_ = false;
};

} // namespace term_reel

#endif // TERM_REEL_CAPTURE_HPP
