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
 * @file codec.cpp
 * @brief Implementation of the UUID binary and text codecs.
 *
 * @details
 * Text decoding follows this grammar:
 *
 * ```
 * uuid      := canonical | hashlike | braced | urn
 * plain     := canonical | hashlike
 * canonical := 8HEXDIG '-' 4HEXDIG '-' 4HEXDIG '-' 4HEXDIG '-' 12HEXDIG
 * hashlike  := 32HEXDIG
 * braced    := '{' plain '}'
 * urn       := "urn:uuid:" plain
 * ```
 *
 * Separators are validated before any hex digit is looked at, so a
 * misplaced dash is reported as `MalformedSeparator` even when the
 * surrounding characters are not hex either.
 */

#include "uuidforge/codec/codec.hpp"

#include "uuidforge/core/error.hpp"

#include <cstring>

namespace uuidforge::codec {

namespace {

constexpr std::string_view URN_PREFIX = "urn:uuid:";

/// Hex digits per canonical group: time_low, time_mid, time_hi, clock_seq, node.
constexpr std::size_t BYTE_GROUPS[] = {8, 4, 4, 4, 12};

int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string quoted(std::string_view input)
{
    return "\"" + std::string(input) + "\"";
}

/**
 * @brief Decodes an even-length run of hex digits into `dst`.
 *
 * @param hex The digits to decode.
 * @param dst Output buffer holding at least `hex.size() / 2` bytes.
 * @param input The complete original text, echoed in the error message.
 */
void decode_hex(std::string_view hex, std::uint8_t* dst, std::string_view input)
{
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw core::Error(core::ErrorKind::InvalidHexDigit,
                              "invalid hex digit in UUID " + quoted(input));
        }
        *dst++ = static_cast<std::uint8_t>((hi << 4) | lo);
    }
}

core::Uuid decode_hash_like(std::string_view text, std::string_view input)
{
    core::Uuid uuid;
    decode_hex(text, uuid.data(), input);
    return uuid;
}

core::Uuid decode_canonical(std::string_view text, std::string_view input)
{
    if (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        throw core::Error(core::ErrorKind::MalformedSeparator,
                          "incorrect UUID format " + quoted(input));
    }

    core::Uuid uuid;
    std::uint8_t* dst = uuid.data();
    std::size_t offset = 0;
    for (std::size_t group : BYTE_GROUPS) {
        decode_hex(text.substr(offset, group), dst, input);
        dst += group / 2;
        offset += group + 1; // skip dash
    }
    return uuid;
}

core::Uuid decode_plain(std::string_view text, std::string_view input)
{
    switch (text.size()) {
    case 32:
        return decode_hash_like(text, input);
    case 36:
        return decode_canonical(text, input);
    default:
        throw core::Error(core::ErrorKind::InvalidLength,
                          "incorrect UUID length " + quoted(input));
    }
}

core::Uuid decode_braced(std::string_view text, std::string_view input)
{
    if (text.front() != '{' || text.back() != '}') {
        throw core::Error(core::ErrorKind::MalformedSeparator,
                          "incorrect UUID format " + quoted(input));
    }
    return decode_plain(text.substr(1, text.size() - 2), input);
}

core::Uuid decode_urn(std::string_view text, std::string_view input)
{
    if (text.compare(0, URN_PREFIX.size(), URN_PREFIX) != 0) {
        throw core::Error(core::ErrorKind::MalformedSeparator,
                          "incorrect URN format " + quoted(input));
    }
    return decode_plain(text.substr(URN_PREFIX.size()), input);
}

} // namespace

std::vector<std::uint8_t> to_binary(const core::Uuid& uuid)
{
    return std::vector<std::uint8_t>(uuid.bytes().begin(), uuid.bytes().end());
}

core::Uuid from_bytes(const std::uint8_t* data, std::size_t length)
{
    if (length != core::Uuid::size) {
        throw core::Error(core::ErrorKind::InvalidLength,
                          "UUID must be exactly 16 bytes long, got " + std::to_string(length) +
                              " bytes");
    }
    core::Uuid uuid;
    std::memcpy(uuid.data(), data, core::Uuid::size);
    return uuid;
}

core::Uuid from_bytes(const std::vector<std::uint8_t>& data)
{
    return from_bytes(data.data(), data.size());
}

core::Uuid from_bytes_or_nil(const std::vector<std::uint8_t>& data)
{
    try {
        return from_bytes(data);
    } catch (const core::Error&) {
        return core::NIL;
    }
}

std::string to_text(const core::Uuid& uuid)
{
    return uuid.to_string();
}

core::Uuid from_string(std::string_view text)
{
    switch (text.size()) {
    case 32:
        return decode_hash_like(text, text);
    case 36:
        return decode_canonical(text, text);
    case 38:
        return decode_braced(text, text);
    case 41:
    case 45:
        return decode_urn(text, text);
    default:
        throw core::Error(core::ErrorKind::InvalidLength,
                          "incorrect UUID length " + quoted(text));
    }
}

core::Uuid from_string_or_nil(std::string_view text)
{
    try {
        return from_string(text);
    } catch (const core::Error&) {
        return core::NIL;
    }
}

} // namespace uuidforge::codec
