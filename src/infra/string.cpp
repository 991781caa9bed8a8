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
 * @file string.cpp
 * @brief Implementation of the String utility class.
 */

#include "uuidforge/infra/string.hpp"

#include <stdexcept>

namespace uuidforge::infra {

long String::to_long(const std::string& option, const std::string& value)
{
    std::size_t consumed = 0;
    long result = 0;
    try {
        result = std::stol(value, &consumed, 10);
    } catch (const std::logic_error&) {
        // std::stol reports both malformed and out-of-range input as logic errors.
        consumed = 0;
    }

    if (consumed == 0 || consumed != value.size()) {
        throw std::invalid_argument("invalid value '" + value + "' for option " + option);
    }
    return result;
}

} // namespace uuidforge::infra
