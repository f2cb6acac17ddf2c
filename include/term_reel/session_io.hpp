/**
 * @file session_io.hpp
 * @brief Persisted session format (.pcr, JSON)
 *
 * @details Document layout:
 *
 *          { "formatVersion": "1.0", "startTime": <epoch ms>,
 *            "endTime": <epoch ms, optional>,
 *            "frames": [ { "timestamp": <ms>, "content": "...",
 *                          "type": "input" | "output" } ],
 *            "terminalInfo": { "name"?, "cwd"?, "shellPath"? },
 *            "dimensions": { "width": 80, "height": 24 } (optional) }
 *
 *          Raw captures use the same layout and may also carry
 *          "type": "correction" frames or legacy "[BACKSPACE]" inputs.
 *
 * @note Loading checks the version before anything else and never returns
 *       a partially built Session: it either succeeds or throws FormatError.
 */

#ifndef TERM_REEL_SESSION_IO_HPP
#define TERM_REEL_SESSION_IO_HPP

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "capture.hpp"
#include "types.hpp"

namespace term_reel {

// **---- nlohmann ADL hooks ----**

void to_json(nlohmann::json &j, const Frame &frame);
void to_json(nlohmann::json &j, const Dimensions &dims);
void to_json(nlohmann::json &j, const TerminalInfo &info);
void to_json(nlohmann::json &j, const Session &session);

/// Validating conversion; throws FormatError like load_session().
void from_json(const nlohmann::json &j, Session &session);

// **---- Sessions ----**

/**
 * @brief Build a Session from a parsed document.
 * @throws IncompatibleFormat, MalformedDocument
 */
Session session_from_json(const nlohmann::json &document);

/**
 * @brief Parse and validate a session document.
 * @throws IncompatibleFormat, MalformedDocument
 */
Session load_session(std::string_view text);

/// Pretty-printed (2-space) JSON text of a session.
std::string save_session(const Session &session);

/**
 * @brief Load a recording from disk.
 * @throws MalformedDocument("document") when the file cannot be read
 */
Session load_session_file(const std::string &path);

/**
 * @brief Write a recording to disk, replacing any existing file.
 * @return false on I/O failure (logged)
 */
bool save_session_file(const std::string &path, const Session &session);

/**
 * @brief Session document plus an "exportInfo" block.
 * @note exportInfo = { exportedAt (ISO-8601 UTC), exportedBy, version }.
 *       Loaders ignore it.
 */
std::string export_session(const Session &session,
                           std::chrono::system_clock::time_point exported_at);

// **---- Raw Captures ----**

/**
 * @brief Parse a raw capture document (markers allowed).
 * @throws IncompatibleFormat, MalformedDocument
 */
RawCapture load_raw_capture(std::string_view text);

RawCapture load_raw_capture_file(const std::string &path);

/// Serialise a raw capture; Deletion events become "correction" frames.
std::string save_raw_capture(const RawCapture &capture);

} // namespace term_reel

#endif // TERM_REEL_SESSION_IO_HPP
