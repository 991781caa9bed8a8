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
 * @file sources.cpp
 * @brief System-backed implementations of the generator sources.
 */

#include "uuidforge/generator/sources.hpp"

#include "uuidforge/core/error.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <memory>
#include <string>

#include <ifaddrs.h>
#include <net/if.h>
#include <netpacket/packet.h>
#include <openssl/rand.h>
#include <sys/socket.h>
#include <unistd.h>

namespace uuidforge::generator {

std::size_t SecureRandomSource::read(std::uint8_t* buffer, std::size_t length)
{
    int chunk = static_cast<int>(std::min<std::size_t>(length, INT_MAX));
    if (RAND_bytes(buffer, chunk) != 1) {
        return 0;
    }
    return static_cast<std::size_t>(chunk);
}

std::chrono::system_clock::time_point system_clock_now()
{
    return std::chrono::system_clock::now();
}

/**
 * @brief Walks every interface link-layer (`AF_PACKET`) entry.
 *
 * Interfaces without an IPv4 address are included, and the list has no
 * fixed size limit.
 */
HardwareAddress system_hardware_address()
{
    struct ifaddrs* raw = nullptr;
    if (::getifaddrs(&raw) == -1) {
        throw core::Error(core::ErrorKind::HardwareAddressUnavailable,
                          std::string("failed to get network interfaces: ") +
                              std::strerror(errno));
    }
    std::unique_ptr<struct ifaddrs, decltype(&::freeifaddrs)> list(raw, &::freeifaddrs);

    for (const struct ifaddrs* it = list.get(); it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_PACKET) {
            continue;
        }
        if (it->ifa_flags & IFF_LOOPBACK) {
            continue;
        }

        const auto* link = reinterpret_cast<const struct sockaddr_ll*>(it->ifa_addr);
        if (link->sll_halen < 6) {
            continue;
        }

        HardwareAddress address{};
        std::memcpy(address.data(), link->sll_addr, address.size());
        if (std::all_of(address.begin(), address.end(), [](std::uint8_t b) { return b == 0; })) {
            continue;
        }
        return address;
    }

    throw core::Error(core::ErrorKind::HardwareAddressUnavailable, "no HW address found");
}

std::uint32_t posix_uid()
{
    return static_cast<std::uint32_t>(::getuid());
}

std::uint32_t posix_gid()
{
    return static_cast<std::uint32_t>(::getgid());
}

} // namespace uuidforge::generator
