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

#include "kairos/gen/timestamp.hpp"

namespace kairos::gen {

std::uint64_t to_unix_millis(infra::TimePoint t)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch());
    return static_cast<std::uint64_t>(ms.count());
}

std::uint64_t to_gregorian_ticks(infra::TimePoint t)
{
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch());
    return GREGORIAN_EPOCH_OFFSET + static_cast<std::uint64_t>(ns.count() / 100);
}

std::uint64_t to_timestamp(TimestampMode mode, infra::TimePoint t)
{
    return mode == TimestampMode::UNIX_MILLIS ? to_unix_millis(t) : to_gregorian_ticks(t);
}

} // namespace kairos::gen
