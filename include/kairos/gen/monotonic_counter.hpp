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
 * @file monotonic_counter.hpp
 * @brief Per-millisecond counter used by monotonic v7 batch issuance.
 */

#pragma once

#include "kairos/infra/epoch_source.hpp"

#include <cstdint>
#include <mutex>

namespace kairos::gen {

/**
 * @struct CounterReading
 * @brief One `(millisecond timestamp, counter)` pair for a batch entry.
 */
struct CounterReading {
    std::uint64_t timestamp_ms;
    std::uint16_t counter;
};

/**
 * @class MonotonicCounter
 * @brief Resets to zero when the millisecond advances, increments when it repeats.
 *
 * @details
 * Unlike `ClockSequenceTracker` there is no random seed, so `next()` cannot
 * fail. The counter has its own lock and its own `last` timestamp; it never
 * touches the clock-sequence state.
 */
class MonotonicCounter {
  public:
    MonotonicCounter();

    MonotonicCounter(const MonotonicCounter&) = delete;
    MonotonicCounter& operator=(const MonotonicCounter&) = delete;

    /**
     * @brief Advances the counter for the instant `now`.
     *
     * - `ms > last`: counter becomes 0.
     * - `ms <= last`: counter is incremented, wrapping at 16 bits.
     */
    CounterReading next(infra::TimePoint now);

  private:
    std::mutex mutex_;
    std::uint64_t last_timestamp_;
    std::uint16_t counter_;
};

} // namespace kairos::gen
