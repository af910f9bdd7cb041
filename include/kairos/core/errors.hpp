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
 * @file errors.hpp
 * @brief Exception hierarchy reported by the Kairos generators.
 *
 * @details
 * Every expected failure of a generation call surfaces synchronously as one of
 * the types below. Nothing is retried internally; the caller decides whether a
 * second attempt makes sense.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kairos::core {

/**
 * @class Error
 * @brief Base class for every error raised by the library.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class RandomSourceExhausted
 * @brief A read from the random-byte provider did not deliver the requested bytes.
 *
 * Raised by clock-sequence seeding, v4/v6/v7 payload draws and batch issuance.
 */
class RandomSourceExhausted : public Error {
  public:
    explicit RandomSourceExhausted(const std::string& message)
        : Error("Random source exhausted: " + message)
    {
    }

  protected:
    RandomSourceExhausted(const std::string& prefix, const std::string& message)
        : Error(prefix + message)
    {
    }
};

/**
 * @class HardwareAddressNotFound
 * @brief No usable interface address was found by a `HardwareAddressSource`.
 *
 * @note Consumed by `HardwareAddressCache`, which falls back to a random node.
 */
class HardwareAddressNotFound : public Error {
  public:
    explicit HardwareAddressNotFound(const std::string& message)
        : Error("Hardware address not found: " + message)
    {
    }
};

/**
 * @class HardwareAddressUnavailable
 * @brief Hardware-address lookup failed and the random fallback failed as well.
 *
 * Only the random fallback can fail here, so this is a `RandomSourceExhausted`.
 */
class HardwareAddressUnavailable : public RandomSourceExhausted {
  public:
    explicit HardwareAddressUnavailable(const std::string& message)
        : RandomSourceExhausted("Hardware address unavailable: ", message)
    {
    }
};

/**
 * @class InvalidBatchSize
 * @brief Batch issuance was requested with a non-positive count.
 */
class InvalidBatchSize : public Error {
  public:
    explicit InvalidBatchSize(long long requested)
        : Error("Batch size must be greater than zero (requested " + std::to_string(requested) +
                ")")
    {
    }
};

/**
 * @class DigestError
 * @brief The hashing backend could not produce a digest.
 */
class DigestError : public Error {
  public:
    explicit DigestError(const std::string& message) : Error("Digest failure: " + message) {}
};

} // namespace kairos::core
