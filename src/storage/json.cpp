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
 * @file json.cpp
 * @brief Implementation of the cJSON bridge.
 */

#include "uuidforge/storage/json.hpp"

#include "uuidforge/core/error.hpp"

#include <string>

namespace uuidforge::storage {

cJSON* to_json(const core::Uuid& uuid)
{
    return cJSON_CreateString(uuid.to_string().c_str());
}

cJSON* to_json(const NullUuid& uuid)
{
    if (!uuid.valid) {
        return cJSON_CreateNull();
    }
    return to_json(uuid.uuid);
}

StoreValue to_store_value(const cJSON* item)
{
    if (!item || cJSON_IsNull(item)) {
        return nullptr;
    }
    if (cJSON_IsBool(item)) {
        return static_cast<bool>(cJSON_IsTrue(item));
    }
    if (cJSON_IsNumber(item)) {
        return item->valuedouble;
    }
    if (cJSON_IsString(item) && item->valuestring) {
        return std::string(item->valuestring);
    }

    const char* kind = cJSON_IsArray(item) ? "array" : cJSON_IsObject(item) ? "object" : "raw";
    throw core::Error(core::ErrorKind::UnsupportedScanType,
                      std::string("cannot convert JSON ") + kind + " to UUID");
}

core::Uuid from_json(const cJSON* item)
{
    return scan(to_store_value(item));
}

NullUuid from_json_nullable(const cJSON* item)
{
    return scan_nullable(to_store_value(item));
}

cJSON* describe(const core::Uuid& uuid)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddItemToObject(obj, "uuid", to_json(uuid));
    cJSON_AddNumberToObject(obj, "version", uuid.version());
    cJSON_AddStringToObject(obj, "variant", core::to_string(uuid.variant()));
    return obj;
}

} // namespace uuidforge::storage
