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
 * @file uuid.cpp
 * @brief Bit-field manipulation and canonical formatting for `Uuid`.
 */

#include "uuidforge/core/uuid.hpp"

#include <algorithm>

namespace uuidforge::core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // namespace

const char* to_string(Variant variant)
{
    switch (variant) {
    case Variant::NCS:
        return "NCS";
    case Variant::RFC4122:
        return "RFC4122";
    case Variant::MICROSOFT:
        return "Microsoft";
    case Variant::FUTURE:
        return "Future";
    }
    return "Future";
}

std::ostream& operator<<(std::ostream& os, Variant variant)
{
    return os << to_string(variant);
}

Variant Uuid::variant() const
{
    const std::uint8_t b = bytes_[8];
    if ((b >> 7) == 0x00) {
        return Variant::NCS;
    }
    if ((b >> 6) == 0x02) {
        return Variant::RFC4122;
    }
    if ((b >> 5) == 0x06) {
        return Variant::MICROSOFT;
    }
    return Variant::FUTURE;
}

void Uuid::set_version(std::uint8_t version)
{
    bytes_[6] = static_cast<std::uint8_t>((bytes_[6] & 0x0f) | (version << 4));
}

/**
 * @brief Rewrites the variant prefix of byte 8.
 *
 * | Variant   | Mask kept | Prefix |
 * |-----------|-----------|--------|
 * | NCS       | `0x7f`    | `0`    |
 * | RFC4122   | `0x3f`    | `10`   |
 * | Microsoft | `0x1f`    | `110`  |
 * | Future    | `0x1f`    | `111`  |
 */
void Uuid::set_variant(Variant variant)
{
    std::uint8_t& b = bytes_[8];
    switch (variant) {
    case Variant::NCS:
        b = static_cast<std::uint8_t>(b & 0x7f);
        break;
    case Variant::RFC4122:
        b = static_cast<std::uint8_t>((b & 0x3f) | 0x80);
        break;
    case Variant::MICROSOFT:
        b = static_cast<std::uint8_t>((b & 0x1f) | 0xc0);
        break;
    case Variant::FUTURE:
        b = static_cast<std::uint8_t>((b & 0x1f) | 0xe0);
        break;
    }
}

bool Uuid::is_nil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::string Uuid::to_string() const
{
    std::string out(36, '-');
    std::size_t pos = 0;
    for (std::size_t i = 0; i < size; ++i) {
        // Dashes already sit at offsets 8, 13, 18 and 23.
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ++pos;
        }
        out[pos++] = HEX_DIGITS[bytes_[i] >> 4];
        out[pos++] = HEX_DIGITS[bytes_[i] & 0x0f];
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
    return os << uuid.to_string();
}

} // namespace uuidforge::core

namespace std {

// FNV-1a over the raw bytes.
std::size_t hash<uuidforge::core::Uuid>::operator()(const uuidforge::core::Uuid& uuid) const noexcept
{
    std::uint64_t h = 14695981039346656037ULL;
    for (std::uint8_t b : uuid.bytes()) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return static_cast<std::size_t>(h);
}

} // namespace std
