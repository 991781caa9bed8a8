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
 * @file codec.hpp
 * @brief Binary and textual marshaling of `Uuid` values.
 *
 * @details
 * Encoding always produces either the 16 raw bytes or the canonical
 * 36-character text. Decoding accepts the raw bytes and four textual forms:
 *
 * | Form       | Length | Example                                         |
 * |------------|--------|-------------------------------------------------|
 * | hash-like  | 32     | `6ba7b8109dad11d180b400c04fd430c8`              |
 * | canonical  | 36     | `6ba7b810-9dad-11d1-80b4-00c04fd430c8`          |
 * | braced     | 38     | `{6ba7b810-9dad-11d1-80b4-00c04fd430c8}`        |
 * | URN        | 41/45  | `urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8` |
 *
 * Hex digits are case-insensitive. All decoders are stateless and safe to
 * call concurrently.
 */

#pragma once

#include "uuidforge/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace uuidforge::codec {

/**
 * @brief Returns the 16 raw bytes of `uuid`, without any header.
 */
std::vector<std::uint8_t> to_binary(const core::Uuid& uuid);

/**
 * @brief Builds a UUID from exactly 16 raw bytes.
 *
 * @param data Pointer to the input bytes (may be null when `length` is 0).
 * @param length Number of input bytes.
 * @return core::Uuid A byte-for-byte copy of the input.
 * @throws core::Error `InvalidLength` when `length != 16`.
 */
core::Uuid from_bytes(const std::uint8_t* data, std::size_t length);

/// @overload
core::Uuid from_bytes(const std::vector<std::uint8_t>& data);

/**
 * @brief Same as `from_bytes`, but returns `core::NIL` instead of throwing.
 */
core::Uuid from_bytes_or_nil(const std::vector<std::uint8_t>& data);

/**
 * @brief Returns the canonical, lower-case, hyphenated text of `uuid`.
 */
std::string to_text(const core::Uuid& uuid);

/**
 * @brief Parses any of the accepted textual forms.
 *
 * Dispatch happens purely on the input length; there is no trimming or
 * partial acceptance.
 *
 * @param text The candidate UUID text.
 * @return core::Uuid The decoded value.
 * @throws core::Error `InvalidLength`, `MalformedSeparator` or
 * `InvalidHexDigit`. The message contains `text`.
 *
 * @code
 * auto id = uuidforge::codec::from_string("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}");
 * @endcode
 */
core::Uuid from_string(std::string_view text);

/**
 * @brief Same as `from_string`, but returns `core::NIL` instead of throwing.
 */
core::Uuid from_string_or_nil(std::string_view text);

} // namespace uuidforge::codec
