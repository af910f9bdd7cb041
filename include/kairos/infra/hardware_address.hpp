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
 * @file hardware_address.hpp
 * @brief Physical (MAC) address provider for the version 1 node field.
 *
 * @details
 * Consumers who do not want to expose the machine's MAC address in v1
 * identifiers can inject their own `HardwareAddressSource` through
 * `GeneratorOptions`.
 */

#pragma once

#include <array>
#include <cstdint>

namespace kairos::infra {

/// @brief A 48-bit IEEE 802 address, transmission order.
using HardwareAddress = std::array<std::uint8_t, 6>;

/**
 * @class HardwareAddressSource
 * @brief Abstract supplier of a 6-byte hardware address.
 */
class HardwareAddressSource {
  public:
    virtual ~HardwareAddressSource() = default;

    /**
     * @brief Looks up a hardware address.
     *
     * @return HardwareAddress The first usable address.
     * @throws kairos::core::HardwareAddressNotFound If no interface qualifies.
     */
    virtual HardwareAddress address() = 0;
};

/**
 * @class SystemHardwareAddressSource
 * @brief Enumerates the host's network interfaces.
 *
 * @details
 * Interfaces are visited in kernel index order. Loopback interfaces and
 * all-zero addresses are skipped; the first remaining 6-byte address wins.
 */
class SystemHardwareAddressSource : public HardwareAddressSource {
  public:
    HardwareAddress address() override;
};

} // namespace kairos::infra
