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
 * @file generator.cpp
 * @brief Orchestration of clock state, node cache, randomness and layouts.
 *
 * @details
 * Each operation gathers its inputs (clock reading, node, random bytes) and
 * hands them to `Encoder`. Errors from the providers are logged here once and
 * rethrown unchanged to the caller.
 */

#include "kairos/gen/generator.hpp"

#include "kairos/core/errors.hpp"
#include "kairos/gen/encoder.hpp"
#include "kairos/infra/logger.hpp"

#include <string>
#include <utility>

namespace kairos::gen {

namespace {

/// @brief Largest value that fits in v7's 12-bit `rand_a` field.
constexpr std::uint16_t RAND_A_MAX = 0x0FFF;

} // namespace

GeneratorOptions Generator::with_defaults(GeneratorOptions options)
{
    if (!options.random) {
        options.random = std::make_shared<infra::SystemRandomSource>();
    }
    if (!options.epoch) {
        options.epoch = std::make_shared<infra::SystemEpochSource>();
    }
    if (!options.hardware_address) {
        options.hardware_address = std::make_shared<infra::SystemHardwareAddressSource>();
    }
    return options;
}

Generator::Generator(GeneratorOptions options)
    : options_(with_defaults(std::move(options))), clock_(options_.random),
      node_(options_.hardware_address, options_.random)
{
}

infra::EpochSource& Generator::epoch()
{
    return *options_.epoch;
}

void Generator::draw(std::uint8_t* out, std::size_t len, const char* purpose)
{
    try {
        options_.random->fill(out, len);
    } catch (const core::RandomSourceExhausted& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           std::string("Generator: ") + purpose + ": " + e.what());
        throw;
    }
}

core::Uuid Generator::new_v1()
{
    return new_v1_at(options_.epoch->now());
}

core::Uuid Generator::new_v1_at(infra::TimePoint t)
{
    ClockReading reading = clock_.next(TimestampMode::GREGORIAN_100NS, t);
    infra::HardwareAddress node = node_.resolve();
    return Encoder::v1(reading.timestamp, reading.sequence, node);
}

core::Uuid Generator::new_v3(const core::Uuid& ns, std::string_view name)
{
    return Encoder::v3(ns, name);
}

core::Uuid Generator::new_v4()
{
    core::Uuid::Bytes random;
    draw(random.data(), random.size(), "v4 payload");
    return Encoder::v4(random);
}

core::Uuid Generator::new_v5(const core::Uuid& ns, std::string_view name)
{
    return Encoder::v5(ns, name);
}

core::Uuid Generator::new_v6()
{
    return new_v6_at(options_.epoch->now());
}

core::Uuid Generator::new_v6_at(infra::TimePoint t)
{
    // Shares the tracker with v1 and v7; the sequence value is not embedded.
    ClockReading reading = clock_.next(TimestampMode::GREGORIAN_100NS, t);

    RandomTail tail;
    draw(tail.data(), tail.size(), "v6 payload");
    return Encoder::v6(reading.timestamp, tail);
}

core::Uuid Generator::new_v7()
{
    return new_v7_at(options_.epoch->now());
}

core::Uuid Generator::new_v7_at(infra::TimePoint t)
{
    ClockReading reading = clock_.next(TimestampMode::UNIX_MILLIS, t);

    RandomTail tail;
    draw(tail.data(), tail.size(), "v7 payload");
    return Encoder::v7(reading.timestamp, reading.sequence, tail);
}

MonotonicGenerator::MonotonicGenerator(GeneratorOptions options) : base_(std::move(options)) {}

std::vector<core::Uuid> MonotonicGenerator::generate_batch_v7(std::int64_t count)
{
    if (count <= 0) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Batch: Rejected batch size " + std::to_string(count));
        throw core::InvalidBatchSize(count);
    }

    std::vector<core::Uuid> batch;

    for (std::int64_t i = 0; i < count; ++i) {
        CounterReading reading = counter_.next(base_.epoch().now());

        if (reading.counter == RAND_A_MAX + 1) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Batch: More than 4096 identifiers in millisecond " +
                                   std::to_string(reading.timestamp_ms) +
                                   "; rand_a wrapped and ordering is no longer strict.");
        }

        RandomTail tail;
        base_.draw(tail.data(), tail.size(), "v7 batch payload");
        batch.push_back(Encoder::v7(reading.timestamp_ms, reading.counter, tail));
    }

    infra::Logger::log(infra::LogLevel::TRACE,
                       "Batch: Issued " + std::to_string(count) + " v7 identifiers");
    return batch;
}

Generator& default_generator()
{
    static Generator instance;
    return instance;
}

} // namespace kairos::gen
