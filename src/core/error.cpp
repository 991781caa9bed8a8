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
 * @file error.cpp
 * @brief Implementation of the library exception type.
 */

#include "uuidforge/core/error.hpp"

namespace uuidforge::core {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::RandomSourceFailure:
        return "RandomSourceFailure";
    case ErrorKind::HardwareAddressUnavailable:
        return "HardwareAddressUnavailable";
    case ErrorKind::InvalidLength:
        return "InvalidLength";
    case ErrorKind::MalformedSeparator:
        return "MalformedSeparator";
    case ErrorKind::InvalidHexDigit:
        return "InvalidHexDigit";
    case ErrorKind::UnsupportedScanType:
        return "UnsupportedScanType";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error("uuidforge: " + message), kind_(kind)
{
}

} // namespace uuidforge::core
