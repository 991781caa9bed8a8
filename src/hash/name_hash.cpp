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
 * @file name_hash.cpp
 * @brief OpenSSL EVP backed implementation of name-based UUIDs.
 */

#include "uuidforge/hash/name_hash.hpp"

#include <openssl/evp.h>

#include <cstring>
#include <memory>
#include <stdexcept>

namespace uuidforge::hash {

core::Uuid from_name(Algorithm algorithm, const core::Uuid& ns, std::string_view name)
{
    const EVP_MD* md = (algorithm == Algorithm::MD5) ? EVP_md5() : EVP_sha1();

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("uuidforge: failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), ns.data(), core::Uuid::size) != 1 ||
        EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("uuidforge: digest computation failed");
    }

    // MD5 yields exactly 16 bytes, SHA-1 yields 20 and is truncated.
    core::Uuid uuid;
    std::memcpy(uuid.data(), digest, core::Uuid::size);

    uuid.set_version(algorithm == Algorithm::MD5 ? core::V3 : core::V5);
    uuid.set_variant(core::Variant::RFC4122);
    return uuid;
}

} // namespace uuidforge::hash
