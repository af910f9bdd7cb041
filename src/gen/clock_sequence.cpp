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
 * @file clock_sequence.cpp
 * @brief Implementation of the clock-sequence state machine.
 */

#include "kairos/gen/clock_sequence.hpp"

#include "kairos/core/errors.hpp"
#include "kairos/infra/logger.hpp"

#include <string>
#include <utility>

namespace kairos::gen {

ClockSequenceTracker::ClockSequenceTracker(std::shared_ptr<infra::RandomSource> random)
    : random_(std::move(random)), seeded_(false), last_timestamp_(0), clock_sequence_(0)
{
}

/**
 * @brief Seeds the sequence with two random bytes, big-endian.
 *
 * Caller holds `mutex_`. `seeded_` is only set once the read succeeded.
 */
void ClockSequenceTracker::seed()
{
    std::uint8_t buf[2];
    try {
        random_->fill(buf, sizeof(buf));
    } catch (const core::RandomSourceExhausted& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Clock: Failed to seed clock sequence: " + std::string(e.what()));
        throw;
    }

    clock_sequence_ = static_cast<std::uint16_t>((buf[0] << 8) | buf[1]);
    seeded_ = true;

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Clock: Sequence seeded at " + std::to_string(clock_sequence_));
}

ClockReading ClockSequenceTracker::next(TimestampMode mode, infra::TimePoint now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (!seeded_) {
        seed();
    }

    std::uint64_t timestamp = to_timestamp(mode, now);

    // Clock did not advance since the previous reading (stall or step backwards).
    if (timestamp <= last_timestamp_) {
        clock_sequence_ = static_cast<std::uint16_t>(clock_sequence_ + 1);
    }
    last_timestamp_ = timestamp;

    return ClockReading{timestamp, clock_sequence_};
}

} // namespace kairos::gen
