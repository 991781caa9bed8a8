/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file error.hpp
 * @brief Exception type raised by generation, decoding and store adapters.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace uuidforge::core {

/**
 * @enum ErrorKind
 * @brief Classifies every failure the library can report.
 */
enum class ErrorKind {
    RandomSourceFailure,        ///< Random source failed or stopped before filling the buffer.
    HardwareAddressUnavailable, ///< No network interface address (recovered by the generator).
    InvalidLength,              ///< Decode input length outside the accepted set.
    MalformedSeparator,         ///< Missing or misplaced '-', brace or URN prefix.
    InvalidHexDigit,            ///< Non-hexadecimal character inside a hex run.
    UnsupportedScanType         ///< Store value of a type that cannot hold a UUID.
};

/**
 * @brief Returns a stable, human-readable name for an error kind.
 */
const char* to_string(ErrorKind kind);

/**
 * @class Error
 * @brief A `std::runtime_error` tagged with an `ErrorKind`.
 *
 * @details
 * Messages are prefixed with `uuidforge: `. Decode failures embed the
 * offending input so logs identify the bad value.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message);

    /// @brief The failure classification.
    ErrorKind kind() const noexcept
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

} // namespace uuidforge::core
