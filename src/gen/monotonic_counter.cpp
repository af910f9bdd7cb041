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

#include "kairos/gen/monotonic_counter.hpp"

#include "kairos/gen/timestamp.hpp"

namespace kairos::gen {

MonotonicCounter::MonotonicCounter() : last_timestamp_(0), counter_(0) {}

CounterReading MonotonicCounter::next(infra::TimePoint now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::uint64_t ms = to_unix_millis(now);

    if (ms > last_timestamp_) {
        counter_ = 0;
    } else {
        counter_ = static_cast<std::uint16_t>(counter_ + 1);
    }
    last_timestamp_ = ms;

    return CounterReading{ms, counter_};
}

} // namespace kairos::gen
