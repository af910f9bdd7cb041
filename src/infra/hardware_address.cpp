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
 * @file hardware_address.cpp
 * @brief Interface enumeration for the default hardware-address provider.
 *
 * @details
 * Uses `if_nameindex()` to list every interface (including those without an IP
 * address) and queries flags and the link-layer address with `ioctl`.
 */

#include "kairos/infra/hardware_address.hpp"

#include "kairos/core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <net/if.h>
#include <string>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace kairos::infra {

namespace {

/// @brief Closes the probe socket on every exit path.
struct SocketCloser {
    int fd;
    ~SocketCloser()
    {
        if (fd >= 0) {
            close(fd);
        }
    }
};

/// @brief Releases the array returned by `if_nameindex()`.
struct NameIndexReleaser {
    struct if_nameindex* list;
    ~NameIndexReleaser()
    {
        if (list) {
            if_freenameindex(list);
        }
    }
};

} // namespace

HardwareAddress SystemHardwareAddressSource::address()
{
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw core::HardwareAddressNotFound(std::string("socket() failed: ") +
                                            std::strerror(errno));
    }
    SocketCloser closer{fd};

    NameIndexReleaser names{if_nameindex()};
    if (!names.list) {
        throw core::HardwareAddressNotFound(std::string("if_nameindex() failed: ") +
                                            std::strerror(errno));
    }

    for (struct if_nameindex* it = names.list; it->if_index != 0 && it->if_name; ++it) {
        struct ifreq ifr;
        std::memset(&ifr, 0, sizeof(ifr));
        std::strncpy(ifr.ifr_name, it->if_name, IFNAMSIZ - 1);

        if (ioctl(fd, SIOCGIFFLAGS, &ifr) != 0 || (ifr.ifr_flags & IFF_LOOPBACK)) {
            continue;
        }
        if (ioctl(fd, SIOCGIFHWADDR, &ifr) != 0) {
            continue;
        }

        HardwareAddress addr;
        std::memcpy(addr.data(), ifr.ifr_hwaddr.sa_data, addr.size());

        // Tunnels and other link types without a MAC report all zeros.
        if (std::all_of(addr.begin(), addr.end(), [](std::uint8_t b) { return b == 0; })) {
            continue;
        }
        return addr;
    }

    throw core::HardwareAddressNotFound("no interface with a 6-byte hardware address");
}

} // namespace kairos::infra
