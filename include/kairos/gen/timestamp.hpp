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
 * @file timestamp.hpp
 * @brief Conversions from wall-clock instants to UUID timestamp fields.
 */

#pragma once

#include "kairos/infra/epoch_source.hpp"

#include <cstdint>

namespace kairos::gen {

/// @brief 100-ns intervals between 1582-10-15T00:00:00Z and the Unix epoch.
constexpr std::uint64_t GREGORIAN_EPOCH_OFFSET = 122192928000000000ULL;

/**
 * @enum TimestampMode
 * @brief Selects the timestamp encoding drawn from the clock.
 */
enum class TimestampMode {
    GREGORIAN_100NS, ///< 60-bit count of 100-ns intervals since the Gregorian reform (v1, v6).
    UNIX_MILLIS      ///< 48-bit Unix time in milliseconds (v7).
};

/**
 * @brief Unix time in milliseconds.
 *
 * Instants before 1970 wrap to large unsigned values, as a two's complement cast would.
 */
std::uint64_t to_unix_millis(infra::TimePoint t);

/// @brief `unix_nanoseconds / 100 + GREGORIAN_EPOCH_OFFSET`.
std::uint64_t to_gregorian_ticks(infra::TimePoint t);

/// @brief Dispatches to one of the two conversions above.
std::uint64_t to_timestamp(TimestampMode mode, infra::TimePoint t);

} // namespace kairos::gen
