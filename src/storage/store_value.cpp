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
 * @file store_value.cpp
 * @brief Implementation of the generic store adapters.
 */

#include "uuidforge/storage/store_value.hpp"

#include "uuidforge/codec/codec.hpp"
#include "uuidforge/core/error.hpp"

#include <string_view>
#include <type_traits>

namespace uuidforge::storage {

const char* type_name(const StoreValue& value)
{
    switch (value.index()) {
    case 0:
        return "null";
    case 1:
        return "bool";
    case 2:
        return "int64";
    case 3:
        return "double";
    case 4:
        return "bytes";
    case 5:
        return "string";
    default:
        return "valueless";
    }
}

StoreValue value(const core::Uuid& uuid)
{
    return uuid.to_string();
}

StoreValue value(const NullUuid& uuid)
{
    if (!uuid.valid) {
        return nullptr;
    }
    return value(uuid.uuid);
}

core::Uuid scan(const StoreValue& value)
{
    return std::visit(
        [&value](const auto& v) -> core::Uuid {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, StoreBytes>) {
                if (v.size() == core::Uuid::size) {
                    return codec::from_bytes(v);
                }
                return codec::from_string(
                    std::string_view(reinterpret_cast<const char*>(v.data()), v.size()));
            } else if constexpr (std::is_same_v<T, std::string>) {
                return codec::from_string(v);
            } else {
                throw core::Error(core::ErrorKind::UnsupportedScanType,
                                  std::string("cannot convert ") + type_name(value) + " to UUID");
            }
        },
        value);
}

NullUuid scan_nullable(const StoreValue& value)
{
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return NullUuid{core::NIL, false};
    }
    return NullUuid{scan(value), true};
}

} // namespace uuidforge::storage
