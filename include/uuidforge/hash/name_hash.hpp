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
 * @file name_hash.hpp
 * @brief Deterministic, name-based UUID construction (versions 3 and 5).
 */

#pragma once

#include "uuidforge/core/uuid.hpp"

#include <string_view>

namespace uuidforge::hash {

/**
 * @enum Algorithm
 * @brief Digest used to derive a name-based UUID.
 */
enum class Algorithm {
    MD5, ///< Version 3.
    SHA1 ///< Version 5.
};

/**
 * @brief Derives a UUID from a namespace and a name.
 *
 * The digest is computed over the 16 namespace bytes followed by the raw
 * bytes of `name`. The first 16 digest bytes become the UUID, then the
 * version (3 for MD5, 5 for SHA-1) and the RFC 4122 variant are stamped.
 *
 * @param algorithm The digest to use.
 * @param ns The namespace UUID.
 * @param name The name within the namespace.
 * @return core::Uuid The same value for the same inputs, every time.
 *
 * @throws std::runtime_error Only if OpenSSL cannot provide the digest.
 */
core::Uuid from_name(Algorithm algorithm, const core::Uuid& ns, std::string_view name);

} // namespace uuidforge::hash
