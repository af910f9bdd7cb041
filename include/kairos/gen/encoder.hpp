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
 * @file encoder.hpp
 * @brief Per-version RFC-9562 byte layouts.
 *
 * @details
 * This file declares `Encoder`, a stateless utility that assembles the 16
 * octets of each supported version from inputs that were already drawn (clock
 * readings, node address, random bytes). Keeping the layout code free of state
 * and I/O makes every bit offset checkable against the RFC test vectors.
 *
 * Every layout starts from a zeroed buffer and finishes by writing the version
 * nibble (octet 6, high half) and the variant bits `10` (octet 8, top two bits).
 */

#pragma once

#include "kairos/core/uuid.hpp"
#include "kairos/infra/hardware_address.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace kairos::gen {

/// @brief The 8 random octets occupying bytes 8-15 of versions 6 and 7.
using RandomTail = std::array<std::uint8_t, 8>;

/**
 * @class Encoder
 * @brief Static layout functions, one per produced version.
 */
class Encoder {
  public:
    /**
     * @brief Version 1: Gregorian time, clock sequence and node.
     *
     * **Layout:**
     * - Octets 0-3: low 32 bits of `ticks` (time_low).
     * - Octets 4-5: next 16 bits (time_mid).
     * - Octets 6-7: top 16 bits (time_high), version in the high nibble.
     * - Octets 8-9: `clock_sequence`, variant in the top two bits.
     * - Octets 10-15: `node`.
     *
     * @param ticks 100-ns intervals since 1582-10-15.
     * @param clock_sequence The tracker's sequence value.
     * @param node The cached hardware address.
     */
    static core::Uuid v1(std::uint64_t ticks, std::uint16_t clock_sequence,
                         const infra::HardwareAddress& node);

    /// @brief Version 3: first 16 octets of MD5(namespace || name).
    static core::Uuid v3(const core::Uuid& ns, std::string_view name);

    /// @brief Version 4: the 16 supplied random octets.
    static core::Uuid v4(const core::Uuid::Bytes& random);

    /// @brief Version 5: first 16 octets of SHA-1(namespace || name).
    static core::Uuid v5(const core::Uuid& ns, std::string_view name);

    /**
     * @brief Version 6: reordered Gregorian time followed by random octets.
     *
     * **Layout:**
     * - Octets 0-3: bits 59-28 of `ticks` (time_high).
     * - Octets 4-5: bits 27-12 (time_mid).
     * - Octets 6-7: bits 11-0 (time_low) under the version nibble.
     * - Octets 8-15: `random`, variant in the top two bits.
     *
     * The clock sequence is deliberately not embedded.
     */
    static core::Uuid v6(std::uint64_t ticks, const RandomTail& random);

    /**
     * @brief Version 7: Unix milliseconds, sequence and random octets.
     *
     * **Layout:**
     * - Octets 0-5: 48-bit big-endian `unix_ms`.
     * - Octets 6-7: `sequence`, its top 4 bits replaced by the version.
     * - Octets 8-15: `random`, variant in the top two bits.
     */
    static core::Uuid v7(std::uint64_t unix_ms, std::uint16_t sequence, const RandomTail& random);
};

} // namespace kairos::gen
