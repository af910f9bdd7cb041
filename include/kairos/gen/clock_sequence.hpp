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
 * @file clock_sequence.hpp
 * @brief Clock-sequence state machine shared by versions 1, 6 and 7.
 *
 * @details
 * This header declares `ClockSequenceTracker`, which pairs each timestamp read
 * from the clock with a 16-bit sequence number. Whenever the clock fails to
 * advance between two calls (a stall within one tick, or a step backwards), the
 * sequence is bumped so the two identifiers still differ in their time-derived
 * bytes.
 */

#pragma once

#include "kairos/gen/timestamp.hpp"
#include "kairos/infra/random_source.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace kairos::gen {

/**
 * @struct ClockReading
 * @brief One `(timestamp, sequence)` pair handed to the encoder.
 */
struct ClockReading {
    std::uint64_t timestamp;
    std::uint16_t sequence;
};

/**
 * @class ClockSequenceTracker
 * @brief Thread-safe `(last timestamp, clock sequence)` state for one generator.
 *
 * @details
 * **State Transitions (per call, under one lock):**
 * 1. On the first successful call the sequence is seeded with 16 random bits.
 * 2. `timestamp <= last` increments the sequence (wrapping at 16 bits).
 * 3. `last` is replaced by the new timestamp unconditionally.
 *
 * A single `last` value is shared by both timestamp modes.
 */
class ClockSequenceTracker {
  public:
    explicit ClockSequenceTracker(std::shared_ptr<infra::RandomSource> random);

    ClockSequenceTracker(const ClockSequenceTracker&) = delete;
    ClockSequenceTracker& operator=(const ClockSequenceTracker&) = delete;

    /**
     * @brief Reads the clock sequence for the instant `now`.
     *
     * @param mode Encoding of the returned timestamp.
     * @param now The instant being stamped.
     * @return ClockReading The timestamp in the requested mode and the sequence to embed.
     *
     * @throws kairos::core::RandomSourceExhausted If the one-time seeding fails.
     * The tracker stays unseeded and the next call tries again.
     *
     * @note The lock is held across the seeding read so that the
     * read-compare-increment-write sequence stays atomic.
     */
    ClockReading next(TimestampMode mode, infra::TimePoint now);

  private:
    void seed();

    std::shared_ptr<infra::RandomSource> random_;

    /// @brief Guards every field below.
    std::mutex mutex_;

    bool seeded_;
    std::uint64_t last_timestamp_;
    std::uint16_t clock_sequence_;
};

} // namespace kairos::gen
