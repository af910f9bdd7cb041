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
 * @file generator.hpp
 * @brief Public entry points for producing RFC-9562 identifiers.
 *
 * @details
 * This header declares `Generator`, which owns the per-instance clock-sequence
 * state and node cache and exposes one operation per version, and
 * `MonotonicGenerator`, which adds strictly ordered v7 batches on top of it.
 *
 * Instances are independent: two generators never share state. All operations
 * are safe to call concurrently on one instance.
 */

#pragma once

#include "kairos/core/uuid.hpp"
#include "kairos/gen/clock_sequence.hpp"
#include "kairos/gen/hardware_address_cache.hpp"
#include "kairos/gen/monotonic_counter.hpp"
#include "kairos/infra/epoch_source.hpp"
#include "kairos/infra/hardware_address.hpp"
#include "kairos/infra/random_source.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace kairos::gen {

/**
 * @struct GeneratorOptions
 * @brief Injectable collaborators. A null field selects the system default.
 *
 * | Field              | Default                            |
 * |--------------------|------------------------------------|
 * | `random`           | `infra::SystemRandomSource`        |
 * | `epoch`            | `infra::SystemEpochSource`         |
 * | `hardware_address` | `infra::SystemHardwareAddressSource` |
 *
 * @code
 * // Example Usage:
 * GeneratorOptions opts;
 * opts.hardware_address = std::make_shared<MyAnonymisedNode>();
 * Generator gen(opts);
 * @endcode
 */
struct GeneratorOptions {
    std::shared_ptr<infra::RandomSource> random;
    std::shared_ptr<infra::EpochSource> epoch;
    std::shared_ptr<infra::HardwareAddressSource> hardware_address;
};

/**
 * @class Generator
 * @brief Produces identifiers of versions 1, 3, 4, 5, 6 and 7.
 *
 * @details
 * Versions 1, 6 and 7 read the shared `ClockSequenceTracker` (v1 and v6 in
 * 100-ns Gregorian mode, v7 in millisecond mode). Version 1 additionally reads
 * the `HardwareAddressCache`. Versions 3 and 5 are pure functions of their
 * arguments and never fail on valid input.
 *
 * @throws kairos::core::RandomSourceExhausted From any operation that draws random bytes.
 */
class Generator {
  public:
    explicit Generator(GeneratorOptions options = {});

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /// @brief Version 1 at the epoch source's current time.
    core::Uuid new_v1();

    /**
     * @brief Version 1 at an explicit instant.
     * @throws kairos::core::HardwareAddressUnavailable If no node can be resolved.
     */
    core::Uuid new_v1_at(infra::TimePoint t);

    /// @brief Version 3 (MD5 name-based). Deterministic in `(ns, name)`.
    core::Uuid new_v3(const core::Uuid& ns, std::string_view name);

    /// @brief Version 4 (random).
    core::Uuid new_v4();

    /// @brief Version 5 (SHA-1 name-based). Deterministic in `(ns, name)`.
    core::Uuid new_v5(const core::Uuid& ns, std::string_view name);

    /// @brief Version 6 at the epoch source's current time.
    core::Uuid new_v6();

    /// @brief Version 6 at an explicit instant. Bytes 8-15 are always fresh random bits.
    core::Uuid new_v6_at(infra::TimePoint t);

    /// @brief Version 7 at the epoch source's current time.
    core::Uuid new_v7();

    /// @brief Version 7 at an explicit instant.
    core::Uuid new_v7_at(infra::TimePoint t);

  private:
    friend class MonotonicGenerator;

    static GeneratorOptions with_defaults(GeneratorOptions options);

    /// @brief The configured clock.
    infra::EpochSource& epoch();

    /**
     * @brief Fills `out` from the random source, logging and rethrowing failures.
     * @param purpose Short description included in the log entry.
     */
    void draw(std::uint8_t* out, std::size_t len, const char* purpose);

    GeneratorOptions options_;
    ClockSequenceTracker clock_;
    HardwareAddressCache node_;
};

/**
 * @class MonotonicGenerator
 * @brief A `Generator` plus an independent counter for ordered v7 batches.
 *
 * @details
 * The monotonic counter has its own lock and its own last-timestamp; batches
 * never disturb the clock sequence used by the single-identifier operations,
 * which are forwarded unchanged to the wrapped generator.
 */
class MonotonicGenerator {
  public:
    explicit MonotonicGenerator(GeneratorOptions options = {});

    core::Uuid new_v1() { return base_.new_v1(); }
    core::Uuid new_v1_at(infra::TimePoint t) { return base_.new_v1_at(t); }
    core::Uuid new_v3(const core::Uuid& ns, std::string_view name) { return base_.new_v3(ns, name); }
    core::Uuid new_v4() { return base_.new_v4(); }
    core::Uuid new_v5(const core::Uuid& ns, std::string_view name) { return base_.new_v5(ns, name); }
    core::Uuid new_v6() { return base_.new_v6(); }
    core::Uuid new_v6_at(infra::TimePoint t) { return base_.new_v6_at(t); }
    core::Uuid new_v7() { return base_.new_v7(); }
    core::Uuid new_v7_at(infra::TimePoint t) { return base_.new_v7_at(t); }

    /**
     * @brief Issues `count` version 7 identifiers in strictly increasing byte order.
     *
     * Each entry re-reads the epoch source and takes its `rand_a` field from the
     * monotonic counter, so entries sharing one millisecond still sort in issue order.
     *
     * @param count Number of identifiers requested.
     * @return std::vector<core::Uuid> Exactly `count` identifiers.
     *
     * @throws kairos::core::InvalidBatchSize If `count <= 0`. Nothing is generated.
     * @throws kairos::core::RandomSourceExhausted If any random draw fails. No partial
     * batch is returned and the counter slot of the failed entry stays consumed.
     *
     * @note Ordering holds for up to 4096 entries per millisecond (the width of `rand_a`).
     */
    std::vector<core::Uuid> generate_batch_v7(std::int64_t count);

    /// @brief The wrapped single-identifier generator.
    Generator& base() { return base_; }

  private:
    Generator base_;
    MonotonicCounter counter_;
};

/**
 * @brief Process-wide generator with default options, constructed on first use.
 *
 * Optional convenience only; nothing in the library depends on it.
 */
Generator& default_generator();

} // namespace kairos::gen
