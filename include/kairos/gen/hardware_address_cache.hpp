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
 * @file hardware_address_cache.hpp
 * @brief Resolve-once cache for the version 1 node field.
 */

#pragma once

#include "kairos/infra/hardware_address.hpp"
#include "kairos/infra/random_source.hpp"

#include <memory>
#include <mutex>

namespace kairos::gen {

/**
 * @class HardwareAddressCache
 * @brief Resolves the node address at most once per generator.
 *
 * @details
 * **Resolution Strategy (first successful call only):**
 * 1. Ask the `HardwareAddressSource`.
 * 2. If it fails, draw 6 random bytes and set the least-significant bit of
 *    byte 0, marking the node as a multicast (non-physical) address.
 * 3. Cache the result. Later calls return it even if the source would now
 *    answer differently.
 */
class HardwareAddressCache {
  public:
    HardwareAddressCache(std::shared_ptr<infra::HardwareAddressSource> source,
                         std::shared_ptr<infra::RandomSource> random);

    HardwareAddressCache(const HardwareAddressCache&) = delete;
    HardwareAddressCache& operator=(const HardwareAddressCache&) = delete;

    /**
     * @brief Returns the cached node address, resolving it on first use.
     *
     * @throws kairos::core::HardwareAddressUnavailable If the source and the random
     * fallback both fail. Nothing is cached in that case.
     */
    infra::HardwareAddress resolve();

  private:
    std::shared_ptr<infra::HardwareAddressSource> source_;
    std::shared_ptr<infra::RandomSource> random_;

    std::mutex mutex_;
    bool resolved_;
    infra::HardwareAddress address_;
};

} // namespace kairos::gen
