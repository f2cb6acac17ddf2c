/**
 * @file types.hpp
 * @brief Core data types and constants for Term Reel
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Format version and dimension constants
 *
 *          - Frame: one timestamped input or output event
 *
 *          - Session: an ordered recording plus its metadata
 */

#ifndef TERM_REEL_TYPES_HPP
#define TERM_REEL_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace term_reel {

// **----- CONSTANTS -----**

/// Major format version this engine reads and writes.
constexpr int SUPPORTED_FORMAT_MAJOR = 1;

/// Version string stamped on newly finalized sessions.
constexpr const char *CURRENT_FORMAT_VERSION = "1.0";

/// File extension of persisted recordings.
constexpr const char *RECORDING_EXTENSION = ".pcr";

/**
 * @brief Terminal grid limits.
 * @note Requests below the minimum fall back to the default, they are never
 *       rejected.
 */
constexpr int DEFAULT_WIDTH = 80;
constexpr int DEFAULT_HEIGHT = 24;
constexpr int MIN_WIDTH = 20;
constexpr int MIN_HEIGHT = 5;

// **----- DATA STRUCTURES -----**

/**
 * @brief FrameKind: origin of a frame's content.
 * @note CorrectionMarker only exists in raw capture streams. A finalized
 *       Session never contains one.
 */
enum class FrameKind { Input, Output, CorrectionMarker };

/**
 * @struct Frame
 * @brief One timestamped event of a recording.
 */
struct Frame {
  int64_t timestamp = 0; //< Milliseconds since session start
  std::string content;   //< Opaque payload, escape sequences included
  FrameKind kind = FrameKind::Output;
};

bool operator==(const Frame &a, const Frame &b);
bool operator!=(const Frame &a, const Frame &b);

/**
 * @struct Dimensions
 * @brief Character grid size of the recorded terminal.
 */
struct Dimensions {
  int width = DEFAULT_WIDTH;
  int height = DEFAULT_HEIGHT;
};

bool operator==(const Dimensions &a, const Dimensions &b);
bool operator!=(const Dimensions &a, const Dimensions &b);

/**
 * @struct TerminalInfo
 * @brief Descriptive metadata, passed through untouched.
 */
struct TerminalInfo {
  std::optional<std::string> name;
  std::optional<std::string> cwd;
  std::optional<std::string> shell_path;
};

bool operator==(const TerminalInfo &a, const TerminalInfo &b);
bool operator!=(const TerminalInfo &a, const TerminalInfo &b);

/**
 * @struct Session
 * @brief A complete recording treated as one value.
 *
 * @note startTime/endTime are absolute wall-clock anchors in epoch
 *       milliseconds. Playback only ever looks at frame timestamps.
 */
struct Session {
  std::string format_version = CURRENT_FORMAT_VERSION;
  int64_t start_time = 0;
  std::optional<int64_t> end_time;
  std::vector<Frame> frames;
  TerminalInfo terminal_info;
  std::optional<Dimensions> dimensions;
};

bool operator==(const Session &a, const Session &b);
bool operator!=(const Session &a, const Session &b);

} // namespace term_reel

#endif // TERM_REEL_TYPES_HPP
