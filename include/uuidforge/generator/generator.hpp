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
 * @file generator.hpp
 * @brief Stateful producer of RFC 4122 UUIDs, versions 1 through 7.
 *
 * @details
 * This file declares the `Generator` class together with a lazily-built,
 * process-wide default instance and free functions that forward to it.
 *
 * **Generation families:**
 * - **Time-based** (`new_v1`, `new_v2`, `new_v6`): Gregorian 100 ns timestamp,
 *   clock sequence and node identifier.
 * - **Random** (`new_v4`, `new_v7`): secure random bytes, with a leading
 *   Unix millisecond timestamp for V7.
 * - **Name-based** (`new_v3`, `new_v5`): digest of namespace and name.
 */

#pragma once

#include "uuidforge/core/uuid.hpp"
#include "uuidforge/generator/sources.hpp"
#include "uuidforge/infra/once_latch.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace uuidforge::generator {

/**
 * @struct GeneratorOptions
 * @brief Injectable dependencies of a `Generator`.
 *
 * Every member left empty is replaced with the system implementation:
 * `SecureRandomSource`, `system_clock_now`, `system_hardware_address`,
 * `posix_uid` and `posix_gid`.
 */
struct GeneratorOptions {
    std::shared_ptr<RandomSource> random;
    Clock clock;
    HardwareAddressProvider hardware_address;
    std::optional<std::uint32_t> uid;
    std::optional<std::uint32_t> gid;
};

/**
 * @class Generator
 * @brief Thread-safe UUID generator owning the clock-sequence and node state.
 *
 * @details
 * The clock sequence and the node identifier are initialized lazily, each
 * behind an `OnceLatch`. A random-source failure during initialization
 * propagates to the caller and leaves the latch open, so a later call can
 * succeed once the source recovers.
 *
 * The pair `(last_time_, clock_sequence_)` and `last_unix_millis_` are read
 * and updated under a single mutex.
 *
 * All generating methods throw `core::Error` with kind `RandomSourceFailure`
 * when the random source cannot fill a buffer. Nothing else is surfaced:
 * a missing hardware address is recovered with a random node identifier.
 */
class Generator {
  public:
    /**
     * @brief Builds a generator; empty options select the system sources.
     */
    explicit Generator(GeneratorOptions options = {});

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief Version 1: Gregorian timestamp, clock sequence and node identifier.
     *
     * Layout: bytes 0-3 `time_low`, 4-5 `time_mid`, 6-7 `time_hi`,
     * 8-9 clock sequence, 10-15 node.
     */
    core::Uuid new_v1();

    /**
     * @brief Version 2: DCE Security UUID.
     *
     * Generated as V1, then bytes 0-3 are replaced with the POSIX UID
     * (`DOMAIN_PERSON`) or GID (`DOMAIN_GROUP`) and byte 9 with `domain`.
     * Other domain values keep the V1 timestamp in bytes 0-3 but still have
     * byte 9 overwritten.
     *
     * @param domain `DOMAIN_PERSON`, `DOMAIN_GROUP`, `DOMAIN_ORG` or any raw byte.
     */
    core::Uuid new_v2(std::uint8_t domain);

    /// @brief Version 3: MD5 of namespace and name. Never fails.
    core::Uuid new_v3(const core::Uuid& ns, std::string_view name);

    /// @brief Version 4: 122 random bits.
    core::Uuid new_v4();

    /// @brief Version 5: SHA-1 of namespace and name. Never fails.
    core::Uuid new_v5(const core::Uuid& ns, std::string_view name);

    /**
     * @brief Version 6: the V1 timestamp reordered most-significant first.
     *
     * Byte order of consecutive V6 values from the same generator follows
     * their timestamp order.
     */
    core::Uuid new_v6();

    /**
     * @brief Version 7: 48-bit Unix milliseconds followed by random bytes.
     *
     * The millisecond value never decreases between calls on the same
     * generator, even if the clock is set back.
     */
    core::Uuid new_v7();

    /// @brief True once the clock sequence has been seeded successfully.
    bool clock_sequence_ready() const
    {
        return clock_sequence_latch_.done();
    }

    /// @brief True once the node identifier has been resolved successfully.
    bool hardware_address_ready() const
    {
        return hardware_address_latch_.done();
    }

  private:
    struct ClockState {
        std::uint64_t timestamp;
        std::uint16_t clock_sequence;
    };

    ClockState clock_state();
    const HardwareAddress& hardware_address();
    std::uint64_t epoch_ticks() const;
    std::uint64_t unix_millis();
    void read_random(std::uint8_t* buffer, std::size_t length, const char* purpose);

    std::shared_ptr<RandomSource> random_;
    Clock clock_;
    HardwareAddressProvider hardware_address_provider_;
    std::uint32_t uid_;
    std::uint32_t gid_;

    infra::OnceLatch clock_sequence_latch_;
    infra::OnceLatch hardware_address_latch_;

    /// @brief Guards `last_time_`, `clock_sequence_` and `last_unix_millis_`.
    std::mutex state_mutex_;
    std::uint64_t last_time_ = 0;
    std::uint16_t clock_sequence_ = 0;
    std::uint64_t last_unix_millis_ = 0;

    HardwareAddress hardware_address_{};
};

/**
 * @brief The process-wide generator, constructed with system sources on first use.
 */
Generator& default_generator();

/// @name Shortcuts to the default generator
/// @{
core::Uuid new_v1();
core::Uuid new_v2(std::uint8_t domain);
core::Uuid new_v3(const core::Uuid& ns, std::string_view name);
core::Uuid new_v4();
core::Uuid new_v5(const core::Uuid& ns, std::string_view name);
core::Uuid new_v6();
core::Uuid new_v7();
/// @}

} // namespace uuidforge::generator
