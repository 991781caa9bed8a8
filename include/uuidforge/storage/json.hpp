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
 * @file json.hpp
 * @brief Bridge between `Uuid` values and cJSON document items.
 *
 * @details
 * JSON documents carry UUIDs as canonical strings (e.g. an `_id` field).
 * Incoming items are mapped onto `StoreValue` and then scanned, so the JSON
 * bridge accepts exactly what the store adapters accept.
 */

#pragma once

#include "uuidforge/core/uuid.hpp"
#include "uuidforge/storage/store_value.hpp"

#include <cJSON.h>

namespace uuidforge::storage {

/**
 * @brief Creates a JSON string item holding the canonical text of `uuid`.
 *
 * @warning The caller owns the returned item and must release it with
 * `cJSON_Delete` (or attach it to a parent that does).
 */
cJSON* to_json(const core::Uuid& uuid);

/**
 * @brief Creates a JSON null item for an absent UUID, a string item otherwise.
 *
 * @warning The caller owns the returned item.
 */
cJSON* to_json(const NullUuid& uuid);

/**
 * @brief Maps a JSON item onto the generic store value it represents.
 *
 * A null pointer (missing field) and JSON `null` map to null, booleans to
 * bool, numbers to double and strings to text.
 *
 * @throws core::Error `UnsupportedScanType` for arrays, objects and raw items.
 */
StoreValue to_store_value(const cJSON* item);

/**
 * @brief Reads a UUID from a JSON item (normally a string).
 *
 * @throws core::Error `UnsupportedScanType` or a decode error.
 */
core::Uuid from_json(const cJSON* item);

/// @brief Reads a possibly-absent UUID; `null` or a missing item yields `{NIL, false}`.
NullUuid from_json_nullable(const cJSON* item);

/**
 * @brief Builds a JSON object describing `uuid`.
 *
 * @code
 * {"uuid": "6ba7b810-9dad-11d1-80b4-00c04fd430c8", "version": 1, "variant": "RFC4122"}
 * @endcode
 *
 * @warning The caller owns the returned object.
 */
cJSON* describe(const core::Uuid& uuid);

} // namespace uuidforge::storage
