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
 * @file sources.hpp
 * @brief Entropy, time and hardware-address sources consumed by the generator.
 *
 * @details
 * The generator never talks to the operating system directly. Every external
 * input goes through one of the seams declared here, so tests can substitute
 * frozen clocks, failing random sources or missing network interfaces.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace uuidforge::generator {

/// @brief A 48-bit IEEE 802 MAC address (or a random stand-in).
using HardwareAddress = std::array<std::uint8_t, 6>;

/// @brief Returns the current wall-clock time.
using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Returns a hardware address.
 *
 * Implementations throw when no suitable interface exists, normally
 * `core::Error` with kind `HardwareAddressUnavailable`. The generator treats
 * any exception as "no address" and falls back to a random node.
 */
using HardwareAddressProvider = std::function<HardwareAddress()>;

/**
 * @class RandomSource
 * @brief Abstract supplier of random bytes.
 *
 * @details
 * `read` may return fewer bytes than requested; the generator keeps reading
 * until its buffer is full. A return value of 0 means the source cannot
 * produce any more data and is treated as a failure. Implementations shared
 * between threads must make `read` thread-safe.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /**
     * @brief Writes up to `length` random bytes into `buffer`.
     *
     * @return std::size_t The number of bytes written, 0 on failure.
     */
    virtual std::size_t read(std::uint8_t* buffer, std::size_t length) = 0;
};

/**
 * @class SecureRandomSource
 * @brief Cryptographically secure source backed by OpenSSL `RAND_bytes`.
 */
class SecureRandomSource : public RandomSource {
  public:
    std::size_t read(std::uint8_t* buffer, std::size_t length) override;
};

/// @brief The system wall clock (`std::chrono::system_clock::now`).
std::chrono::system_clock::time_point system_clock_now();

/**
 * @brief Looks up the MAC address of the first non-loopback interface.
 *
 * Enumerates interfaces with `getifaddrs` and reads the link-layer
 * (`AF_PACKET`) address of each one. All-zero addresses are skipped.
 *
 * @throws core::Error `HardwareAddressUnavailable` if nothing usable is found.
 */
HardwareAddress system_hardware_address();

/// @brief Real user ID of the calling process.
std::uint32_t posix_uid();

/// @brief Real group ID of the calling process.
std::uint32_t posix_gid();

} // namespace uuidforge::generator
