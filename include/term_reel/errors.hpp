/**
 * @file errors.hpp
 * @brief Load-time error types
 *
 * @details Only loading a persisted document can fail. Every other engine
 *          operation is total.
 *
 *          - IncompatibleFormat: major formatVersion differs from ours
 *
 *          - MalformedDocument: unparseable text or a missing/invalid field
 */

#ifndef TERM_REEL_ERRORS_HPP
#define TERM_REEL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace term_reel {

/**
 * @class FormatError
 * @brief Base of every load-time failure.
 */
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @class IncompatibleFormat
 * @brief The document's major version is not the one this engine supports.
 */
class IncompatibleFormat : public FormatError {
public:
  IncompatibleFormat(std::string version, int supported_major);

  const std::string &version() const { return version_; }
  int supported_major() const { return supported_major_; }

private:
  std::string version_;
  int supported_major_;
};

/**
 * @class MalformedDocument
 * @brief Structurally invalid document.
 * @note field() is a JSON path such as "frames[3].type", or "document" when
 *       the text could not be parsed at all.
 */
class MalformedDocument : public FormatError {
public:
  MalformedDocument(std::string field, const std::string &reason);

  const std::string &field() const { return field_; }

private:
  std::string field_;
};

} // namespace term_reel

#endif // TERM_REEL_ERRORS_HPP
