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
 * @file store_value.hpp
 * @brief Conversions between `Uuid` and generic storage values.
 *
 * @details
 * Key-value stores and database drivers exchange a small set of scalar types.
 * `StoreValue` models that set as a tagged union. UUIDs are written as their
 * canonical text and can be read back from raw 16-byte blobs or from any
 * accepted textual form.
 *
 * **Mapping:**
 * | Direction | Input                    | Result                         |
 * |-----------|--------------------------|--------------------------------|
 * | value     | `Uuid`                   | text                           |
 * | value     | `NullUuid` (invalid)     | null                           |
 * | scan      | bytes, length 16         | binary UUID                    |
 * | scan      | bytes, other length      | decoded as text                |
 * | scan      | text                     | decoded as text                |
 * | scan      | null, bool, int, double  | `UnsupportedScanType`          |
 */

#pragma once

#include "uuidforge/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace uuidforge::storage {

/// @brief A binary blob as handed over by a store.
using StoreBytes = std::vector<std::uint8_t>;

/// @brief Scalar values a generic store can hold.
using StoreValue = std::variant<std::nullptr_t, bool, std::int64_t, double, StoreBytes, std::string>;

/// @brief Name of the alternative held by `value` ("null", "bool", "int64", ...).
const char* type_name(const StoreValue& value);

/**
 * @struct NullUuid
 * @brief A UUID that may be absent (SQL `NULL`).
 *
 * `valid == false` means absent; `uuid` is then `core::NIL`.
 */
struct NullUuid {
    core::Uuid uuid;
    bool valid = false;
};

/// @brief Store representation of `uuid`: its canonical text.
StoreValue value(const core::Uuid& uuid);

/// @brief Store representation of `uuid`: null if absent, else canonical text.
StoreValue value(const NullUuid& uuid);

/**
 * @brief Reads a UUID from a store value.
 *
 * @throws core::Error `UnsupportedScanType` for null and non-byte, non-text
 * values; decode errors from `codec` for malformed bytes or text.
 */
core::Uuid scan(const StoreValue& value);

/**
 * @brief Reads a possibly-absent UUID from a store value.
 *
 * Null yields `{NIL, false}`; every other value is delegated to `scan`.
 */
NullUuid scan_nullable(const StoreValue& value);

} // namespace uuidforge::storage
