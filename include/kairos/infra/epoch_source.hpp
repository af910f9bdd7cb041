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
 * @file epoch_source.hpp
 * @brief Wall-clock provider for the time-based versions (1, 6, 7).
 */

#pragma once

#include <chrono>

namespace kairos::infra {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @class EpochSource
 * @brief Abstract supplier of the current time.
 *
 * @details
 * Injected through `GeneratorOptions` so tests can freeze or script the clock.
 */
class EpochSource {
  public:
    virtual ~EpochSource() = default;

    /// @brief The current instant on the UTC wall clock.
    virtual TimePoint now() = 0;
};

/**
 * @class SystemEpochSource
 * @brief `EpochSource` reading `std::chrono::system_clock`.
 */
class SystemEpochSource : public EpochSource {
  public:
    TimePoint now() override { return std::chrono::system_clock::now(); }
};

} // namespace kairos::infra
