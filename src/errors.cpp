/**
 * @file errors.cpp
 * @brief Load-time error types implementation
 */

#include "term_reel/errors.hpp"

#include <utility>

#include <fmt/core.h>

namespace term_reel {

IncompatibleFormat::IncompatibleFormat(std::string version,
                                       int supported_major)
    : FormatError(fmt::format(
          "Incompatible format version '{}' (supported major version: {})",
          version, supported_major)),
      version_(std::move(version)), supported_major_(supported_major) {}

MalformedDocument::MalformedDocument(std::string field,
                                     const std::string &reason)
    : FormatError(fmt::format("Malformed document at '{}': {}", field, reason)),
      field_(std::move(field)) {}

} // namespace term_reel
