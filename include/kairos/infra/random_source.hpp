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
 * @file random_source.hpp
 * @brief Entropy provider consumed by the generators.
 *
 * @details
 * Random bytes seed the clock sequence, fill the payload of versions 4, 6 and 7,
 * and stand in for the node when no hardware address can be found. The default
 * implementation draws from the OpenSSL CSPRNG.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace kairos::infra {

/**
 * @class RandomSource
 * @brief Abstract supplier of cryptographically strong random bytes.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /**
     * @brief Fills `out` with exactly `len` random bytes.
     *
     * @param out Destination buffer.
     * @param len Number of bytes requested.
     * @throws kairos::core::RandomSourceExhausted If fewer than `len` bytes are available.
     *
     * @note Implementations must be safe to call from several threads at once.
     */
    virtual void fill(std::uint8_t* out, std::size_t len) = 0;
};

/**
 * @class SystemRandomSource
 * @brief `RandomSource` backed by OpenSSL `RAND_bytes`.
 */
class SystemRandomSource : public RandomSource {
  public:
    void fill(std::uint8_t* out, std::size_t len) override;
};

} // namespace kairos::infra
