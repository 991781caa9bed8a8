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
 * @file uuid.hpp
 * @brief The 16-byte UUID value type and its RFC 4122 bit-field accessors.
 *
 * @details
 * `Uuid` is a transparent 16-byte record: freely copyable, compared and
 * ordered byte-wise, hashable. The layout of the individual bytes depends on
 * the version that produced the value; only the version nibble (byte 6) and
 * the variant bits (byte 8) have a fixed meaning.
 *
 * ```
 *  byte:  0  1  2  3   4  5   6  7   8  9   10 11 12 13 14 15
 *        [time_low ]  [mid ] [ver ] [var ] [      node       ]
 * ```
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace uuidforge::core {

/// @name Versions
/// @brief Values stored in the high nibble of byte 6.
/// @{
inline constexpr std::uint8_t V1 = 1; ///< Gregorian time + node.
inline constexpr std::uint8_t V2 = 2; ///< DCE Security (time + POSIX UID/GID).
inline constexpr std::uint8_t V3 = 3; ///< Name-based, MD5.
inline constexpr std::uint8_t V4 = 4; ///< Random.
inline constexpr std::uint8_t V5 = 5; ///< Name-based, SHA-1.
inline constexpr std::uint8_t V6 = 6; ///< Reordered Gregorian time (sortable).
inline constexpr std::uint8_t V7 = 7; ///< Unix milliseconds + random.
/// @}

/// @name DCE Security domains (byte 9 of a V2 UUID)
/// @{
inline constexpr std::uint8_t DOMAIN_PERSON = 0;
inline constexpr std::uint8_t DOMAIN_GROUP = 1;
inline constexpr std::uint8_t DOMAIN_ORG = 2;
/// @}

/**
 * @enum Variant
 * @brief Interpretation family encoded in the leading bits of byte 8.
 */
enum class Variant {
    NCS,       ///< `0xx`: Reserved, NCS backward compatibility.
    RFC4122,   ///< `10x`: The layout defined by RFC 4122.
    MICROSOFT, ///< `110`: Reserved, Microsoft GUID backward compatibility.
    FUTURE     ///< `111`: Reserved for future definition.
};

/// @brief Returns the display name of a variant ("NCS", "RFC4122", ...).
const char* to_string(Variant variant);

std::ostream& operator<<(std::ostream& os, Variant variant);

/**
 * @class Uuid
 * @brief A Universally Unique Identifier stored as 16 raw bytes.
 *
 * @details
 * A default-constructed `Uuid` is the Nil UUID (all zeros).
 */
class Uuid {
  public:
    /// @brief Number of bytes in every UUID.
    static constexpr std::size_t size = 16;

    using Bytes = std::array<std::uint8_t, size>;

    constexpr Uuid() : bytes_{} {}
    constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief Returns the version nibble (high 4 bits of byte 6).
    std::uint8_t version() const
    {
        return bytes_[6] >> 4;
    }

    /**
     * @brief Decodes the variant from the leading bits of byte 8.
     *
     * The bits are inspected from the shortest prefix: `0` (NCS), `10`
     * (RFC 4122), `110` (Microsoft), anything else (Future).
     */
    Variant variant() const;

    /**
     * @brief Overwrites the version nibble, leaving the low nibble of byte 6 intact.
     *
     * @param version A version number, normally one of `V1`..`V7`.
     */
    void set_version(std::uint8_t version);

    /**
     * @brief Overwrites the variant bits of byte 8.
     *
     * NCS clears only bit 7, RFC 4122 rewrites the top two bits, Microsoft
     * and Future rewrite the top three bits.
     */
    void set_variant(Variant variant);

    /// @brief Read-only view of the raw bytes.
    const Bytes& bytes() const
    {
        return bytes_;
    }

    /// @brief Mutable pointer to the first of the 16 raw bytes.
    std::uint8_t* data()
    {
        return bytes_.data();
    }

    const std::uint8_t* data() const
    {
        return bytes_.data();
    }

    std::uint8_t& operator[](std::size_t index)
    {
        return bytes_[index];
    }

    std::uint8_t operator[](std::size_t index) const
    {
        return bytes_[index];
    }

    /// @brief True if every byte is zero.
    bool is_nil() const;

    /**
     * @brief Formats the UUID in canonical form.
     *
     * @return std::string 36 lower-case characters, e.g.
     * `"6ba7b810-9dad-11d1-80b4-00c04fd430c8"`.
     */
    std::string to_string() const;

    friend bool operator==(const Uuid& lhs, const Uuid& rhs)
    {
        return lhs.bytes_ == rhs.bytes_;
    }

    friend bool operator!=(const Uuid& lhs, const Uuid& rhs)
    {
        return lhs.bytes_ != rhs.bytes_;
    }

    /// @brief Lexicographic byte order (matches time order for V6 and V7).
    friend bool operator<(const Uuid& lhs, const Uuid& rhs)
    {
        return lhs.bytes_ < rhs.bytes_;
    }

  private:
    Bytes bytes_;
};

/// @brief Writes the canonical form of `uuid` to `os`.
std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

/// @brief The Nil UUID (all 16 bytes zero).
inline constexpr Uuid NIL{};

/// @name Well-known namespaces from RFC 4122 Appendix C
/// @{
inline constexpr Uuid NAMESPACE_DNS{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                                                0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_URL{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                                                0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_OID{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                                                0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_X500{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                                                 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
/// @}

} // namespace uuidforge::core

namespace std {

template <> struct hash<uuidforge::core::Uuid> {
    std::size_t operator()(const uuidforge::core::Uuid& uuid) const noexcept;
};

} // namespace std
