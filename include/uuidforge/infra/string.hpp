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
 * @file string.hpp
 * @brief Supplementary string conversion primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to the
 * standard conversions used when reading command-line option values.
 */

#pragma once

#include <string>

namespace uuidforge::infra {

/**
 * @class String
 * @brief A static container for text conversion helpers.
 */
class String {
  public:
    /**
     * @brief Converts an option value to a base-10 integer.
     *
     * The whole value must be consumed: `"12"` is accepted, `"12x"`, `""` and
     * `"abc"` are not. Values outside the range of `long` are rejected.
     *
     * @param option The option name, used in the error message (e.g. `--count`).
     * @param value The raw text supplied for the option.
     * @return long The parsed value.
     * @throws std::invalid_argument naming both the option and the value.
     *
     * @code
     * long n = uuidforge::infra::String::to_long("--count", "3"); // 3
     * @endcode
     */
    static long to_long(const std::string& option, const std::string& value);
};

} // namespace uuidforge::infra
