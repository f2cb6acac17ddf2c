/**
 * @file capture.cpp
 * @brief Raw capture events and recording line discipline implementation
 */

#include "term_reel/capture.hpp"

#include <algorithm>
#include <type_traits>

#include "term_reel/logging.hpp"
#include "term_reel/session.hpp"

namespace term_reel {

// **---- Event <-> Frame Conversion ----**

std::vector<Frame> to_raw_frames(const std::vector<CaptureEvent> &events) {
  std::vector<Frame> frames;
  frames.reserve(events.size());
  for (const auto &event : events) {
    std::visit(
        [&frames](const auto &e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, Keystroke>) {
            frames.push_back(make_input(e.timestamp, e.content));
          } else if constexpr (std::is_same_v<T, Deletion>) {
            frames.push_back(make_marker(e.timestamp));
          } else {
            frames.push_back(make_output(e.timestamp, e.content));
          }
        },
        event);
  }
  return frames;
}

std::vector<Frame> decode_legacy_markers(std::vector<Frame> frames) {
  for (auto &f : frames) {
    if (f.kind == FrameKind::Input && f.content == LEGACY_BACKSPACE_SENTINEL) {
      f.kind = FrameKind::CorrectionMarker;
      f.content.clear();
    }
  }
  return frames;
}

std::vector<CaptureEvent> from_raw_frames(const std::vector<Frame> &frames) {
  std::vector<CaptureEvent> events;
  events.reserve(frames.size());
  for (const auto &f : frames) {
    switch (f.kind) {
    case FrameKind::Input:
      events.emplace_back(Keystroke{f.timestamp, f.content});
      break;
    case FrameKind::CorrectionMarker:
      events.emplace_back(Deletion{f.timestamp});
      break;
    case FrameKind::Output:
      events.emplace_back(Flush{f.timestamp, f.content});
      break;
    }
  }
  return events;
}

// **---- CaptureRecorder ----**

CaptureRecorder::CaptureRecorder(Clock clock, TerminalInfo terminal_info)
    : clock_(std::move(clock)), terminal_info_(std::move(terminal_info)) {}

void CaptureRecorder::start() {
  if (recording_) {
    LOG_WARN("Recording is already in progress");
    return;
  }
  capture_ = RawCapture{};
  capture_.start_time = clock_();
  capture_.terminal_info = terminal_info_;
  line_.clear();
  recording_ = true;
}

int64_t CaptureRecorder::elapsed() {
  /// Wall clocks can step backwards; timestamps never go negative
  return std::max<int64_t>(0, clock_() - capture_.start_time);
}

std::string CaptureRecorder::feed_input(std::string_view bytes) {
  std::string echo;
  if (!recording_)
    return echo;

  for (char ch : bytes) {
    unsigned char code = static_cast<unsigned char>(ch);
    if (code >= 32 && code <= 126) {
      line_ += ch;
      echo += ch;
      capture_.events.emplace_back(Keystroke{elapsed(), std::string(1, ch)});
    } else if (code == 8 || code == 127) {
      if (line_.empty())
        continue;
      line_.pop_back();
      echo += "\b \b";
      capture_.events.emplace_back(Deletion{elapsed()});
    } else if (code == 13) {
      echo += "\r\n";
      capture_.events.emplace_back(Keystroke{elapsed(), "\r\n"});
      if (command_sink_) {
        command_sink_(line_ + "\n");
      }
      line_.clear();
    }
  }
  return echo;
}

void CaptureRecorder::feed_output(std::string_view chunk) {
  if (!recording_ || chunk.empty())
    return;
  capture_.events.emplace_back(Flush{elapsed(), std::string(chunk)});
}

RawCapture CaptureRecorder::stop() {
  if (!recording_) {
    LOG_WARN("No recording in progress");
    return RawCapture{};
  }
  recording_ = false;
  capture_.end_time = clock_();
  line_.clear();
  return std::move(capture_);
}

} // namespace term_reel
