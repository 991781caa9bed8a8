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
 * @file generator.cpp
 * @brief Implementation of the UUID generator.
 *
 * @details
 * Time-based versions share `clock_state()`, which returns a timestamp that
 * never decreases and bumps the clock sequence whenever the clock has not
 * advanced past the previously returned value (same tick or regression).
 */

#include "uuidforge/generator/generator.hpp"

#include "uuidforge/core/error.hpp"
#include "uuidforge/hash/name_hash.hpp"
#include "uuidforge/infra/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <utility>

namespace uuidforge::generator {

namespace {

/// 100 ns intervals between the UUID epoch (1582-10-15) and the Unix epoch.
constexpr std::uint64_t EPOCH_START = 122192928000000000ULL;

void put_uint16(std::uint8_t* dst, std::uint16_t v)
{
    dst[0] = static_cast<std::uint8_t>(v >> 8);
    dst[1] = static_cast<std::uint8_t>(v);
}

void put_uint32(std::uint8_t* dst, std::uint32_t v)
{
    dst[0] = static_cast<std::uint8_t>(v >> 24);
    dst[1] = static_cast<std::uint8_t>(v >> 16);
    dst[2] = static_cast<std::uint8_t>(v >> 8);
    dst[3] = static_cast<std::uint8_t>(v);
}

void put_uint48(std::uint8_t* dst, std::uint64_t v)
{
    dst[0] = static_cast<std::uint8_t>(v >> 40);
    dst[1] = static_cast<std::uint8_t>(v >> 32);
    dst[2] = static_cast<std::uint8_t>(v >> 24);
    dst[3] = static_cast<std::uint8_t>(v >> 16);
    dst[4] = static_cast<std::uint8_t>(v >> 8);
    dst[5] = static_cast<std::uint8_t>(v);
}

std::string format_hardware_address(const HardwareAddress& address)
{
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", address[0], address[1],
                  address[2], address[3], address[4], address[5]);
    return buf;
}

void finalize(core::Uuid& uuid, std::uint8_t version)
{
    uuid.set_version(version);
    uuid.set_variant(core::Variant::RFC4122);
}

} // namespace

Generator::Generator(GeneratorOptions options)
    : random_(std::move(options.random)),
      clock_(std::move(options.clock)),
      hardware_address_provider_(std::move(options.hardware_address)),
      uid_(options.uid ? *options.uid : posix_uid()),
      gid_(options.gid ? *options.gid : posix_gid())
{
    if (!random_) {
        random_ = std::make_shared<SecureRandomSource>();
    }
    if (!clock_) {
        clock_ = system_clock_now;
    }
    if (!hardware_address_provider_) {
        hardware_address_provider_ = system_hardware_address;
    }
}

/**
 * @brief Fills `buffer` completely from the random source.
 *
 * Short reads are retried; a read that yields nothing aborts the operation.
 *
 * @param purpose Names the failed step in the error message.
 */
void Generator::read_random(std::uint8_t* buffer, std::size_t length, const char* purpose)
{
    std::size_t filled = 0;
    while (filled < length) {
        std::size_t n = random_->read(buffer + filled, length - filled);
        if (n == 0) {
            throw core::Error(core::ErrorKind::RandomSourceFailure,
                              std::string("failed to read random data for ") + purpose);
        }
        filled += n;
    }
}

std::uint64_t Generator::epoch_ticks() const
{
    auto since_unix =
        std::chrono::duration_cast<std::chrono::nanoseconds>(clock_().time_since_epoch()).count();
    return EPOCH_START + static_cast<std::uint64_t>(since_unix / 100);
}

/**
 * @brief Returns the next (timestamp, clock sequence) pair.
 *
 * Implementation Strategy:
 * 1. **Seeding**: The clock sequence starts from two random bytes, drawn
 *    once per generator behind `clock_sequence_latch_`.
 * 2. **Monotonicity**: Under `state_mutex_`, a sample that is not strictly
 *    newer than `last_time_` increments the clock sequence and reuses
 *    `last_time_`; a newer sample replaces it.
 */
Generator::ClockState Generator::clock_state()
{
    clock_sequence_latch_.call([this] {
        std::uint8_t buf[2];
        read_random(buf, sizeof(buf), "clock sequence");

        std::lock_guard<std::mutex> lock(state_mutex_);
        clock_sequence_ = static_cast<std::uint16_t>((buf[0] << 8) | buf[1]);
        infra::Logger::log(infra::LogLevel::DEBUG, "Generator: Clock sequence seeded.");
    });

    std::lock_guard<std::mutex> lock(state_mutex_);

    std::uint64_t now = epoch_ticks();
    if (now <= last_time_) {
        ++clock_sequence_;
    } else {
        last_time_ = now;
    }

    return ClockState{last_time_, clock_sequence_};
}

/**
 * @brief Resolves the node identifier once per generator.
 *
 * Any provider failure is recovered locally: six random bytes are used
 * instead, with the multicast bit set (RFC 4122 section 4.5). Only a failure
 * of the random source itself reaches the caller.
 */
const HardwareAddress& Generator::hardware_address()
{
    hardware_address_latch_.call([this] {
        try {
            hardware_address_ = hardware_address_provider_();
            if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
                infra::Logger::log(infra::LogLevel::DEBUG,
                                   "Generator: Using hardware address " +
                                       format_hardware_address(hardware_address_) + ".");
            }
            return;
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::WARN,
                               std::string("Generator: ") + e.what() +
                                   ". Falling back to a random node identifier.");
        }

        HardwareAddress node{};
        read_random(node.data(), node.size(), "hardware address");
        node[0] |= 0x01; // multicast bit
        hardware_address_ = node;
    });

    return hardware_address_;
}

core::Uuid Generator::new_v1()
{
    ClockState state = clock_state();
    const HardwareAddress& node = hardware_address();

    core::Uuid uuid;
    put_uint32(uuid.data(), static_cast<std::uint32_t>(state.timestamp));
    put_uint16(uuid.data() + 4, static_cast<std::uint16_t>(state.timestamp >> 32));
    put_uint16(uuid.data() + 6, static_cast<std::uint16_t>(state.timestamp >> 48));
    put_uint16(uuid.data() + 8, state.clock_sequence);
    std::memcpy(uuid.data() + 10, node.data(), node.size());

    finalize(uuid, core::V1);
    return uuid;
}

core::Uuid Generator::new_v2(std::uint8_t domain)
{
    core::Uuid uuid = new_v1();

    switch (domain) {
    case core::DOMAIN_PERSON:
        put_uint32(uuid.data(), uid_);
        break;
    case core::DOMAIN_GROUP:
        put_uint32(uuid.data(), gid_);
        break;
    default:
        break;
    }

    uuid[9] = domain;

    finalize(uuid, core::V2);
    return uuid;
}

core::Uuid Generator::new_v3(const core::Uuid& ns, std::string_view name)
{
    return hash::from_name(hash::Algorithm::MD5, ns, name);
}

core::Uuid Generator::new_v4()
{
    core::Uuid uuid;
    read_random(uuid.data(), core::Uuid::size, "UUID v4");

    finalize(uuid, core::V4);
    return uuid;
}

core::Uuid Generator::new_v5(const core::Uuid& ns, std::string_view name)
{
    return hash::from_name(hash::Algorithm::SHA1, ns, name);
}

core::Uuid Generator::new_v6()
{
    ClockState state = clock_state();
    const HardwareAddress& node = hardware_address();

    core::Uuid uuid;
    put_uint16(uuid.data(), static_cast<std::uint16_t>(state.timestamp >> 48));
    put_uint32(uuid.data() + 2, static_cast<std::uint32_t>(state.timestamp >> 16));
    put_uint16(uuid.data() + 6, static_cast<std::uint16_t>(state.timestamp));
    put_uint16(uuid.data() + 8, state.clock_sequence);
    std::memcpy(uuid.data() + 10, node.data(), node.size());

    finalize(uuid, core::V6);
    return uuid;
}

std::uint64_t Generator::unix_millis()
{
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch())
                   .count();
    std::uint64_t millis = now > 0 ? static_cast<std::uint64_t>(now) : 0;

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_unix_millis_ = std::max(last_unix_millis_, millis);
    return last_unix_millis_;
}

core::Uuid Generator::new_v7()
{
    core::Uuid uuid;
    put_uint48(uuid.data(), unix_millis());
    read_random(uuid.data() + 6, core::Uuid::size - 6, "UUID v7");

    // Version and variant land inside the random tail.
    finalize(uuid, core::V7);
    return uuid;
}

Generator& default_generator()
{
    static Generator instance;
    return instance;
}

core::Uuid new_v1()
{
    return default_generator().new_v1();
}

core::Uuid new_v2(std::uint8_t domain)
{
    return default_generator().new_v2(domain);
}

core::Uuid new_v3(const core::Uuid& ns, std::string_view name)
{
    return default_generator().new_v3(ns, name);
}

core::Uuid new_v4()
{
    return default_generator().new_v4();
}

core::Uuid new_v5(const core::Uuid& ns, std::string_view name)
{
    return default_generator().new_v5(ns, name);
}

core::Uuid new_v6()
{
    return default_generator().new_v6();
}

core::Uuid new_v7()
{
    return default_generator().new_v7();
}

} // namespace uuidforge::generator
