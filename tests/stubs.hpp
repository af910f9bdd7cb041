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
 * @file stubs.hpp
 * @brief Deterministic providers injected into generators under test.
 */

#pragma once

#include "kairos/core/errors.hpp"
#include "kairos/infra/epoch_source.hpp"
#include "kairos/infra/hardware_address.hpp"
#include "kairos/infra/random_source.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kairos::test {

/// @brief Builds a time point `ms` milliseconds after the Unix epoch.
inline infra::TimePoint at_millis(std::uint64_t ms)
{
    return infra::TimePoint(std::chrono::milliseconds(ms));
}

/**
 * @brief A clock that stays at one instant until moved.
 */
class FixedEpoch : public infra::EpochSource {
  public:
    explicit FixedEpoch(infra::TimePoint t) : now_(t) {}

    infra::TimePoint now() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(infra::TimePoint t)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

  private:
    std::mutex mutex_;
    infra::TimePoint now_;
};

/**
 * @brief Returns the scripted instants in order, then repeats the last one.
 */
class ScriptedEpoch : public infra::EpochSource {
  public:
    explicit ScriptedEpoch(std::vector<infra::TimePoint> script) : script_(std::move(script)) {}

    infra::TimePoint now() override
    {
        if (next_ + 1 < script_.size()) {
            return script_[next_++];
        }
        return script_.back();
    }

  private:
    std::vector<infra::TimePoint> script_;
    std::size_t next_ = 0;
};

/**
 * @brief Always yields zero bytes.
 */
class ZeroRandom : public infra::RandomSource {
  public:
    void fill(std::uint8_t* out, std::size_t len) override { std::memset(out, 0, len); }
};

/**
 * @brief Serves bytes from a fixed script and throws once it runs dry.
 */
class ScriptedRandom : public infra::RandomSource {
  public:
    explicit ScriptedRandom(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

    void fill(std::uint8_t* out, std::size_t len) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bytes_.size() - offset_ < len) {
            throw core::RandomSourceExhausted("script exhausted");
        }
        std::memcpy(out, bytes_.data() + offset_, len);
        offset_ += len;
    }

    std::size_t consumed()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return offset_;
    }

  private:
    std::mutex mutex_;
    std::vector<std::uint8_t> bytes_;
    std::size_t offset_ = 0;
};

/**
 * @brief Counts bytes upwards from a seed; fails every call once `budget` calls were served.
 */
class BudgetRandom : public infra::RandomSource {
  public:
    explicit BudgetRandom(std::size_t budget, std::uint8_t seed = 0) : budget_(budget), value_(seed)
    {
    }

    void fill(std::uint8_t* out, std::size_t len) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (calls_ >= budget_) {
            throw core::RandomSourceExhausted("budget of " + std::to_string(budget_) +
                                              " calls spent");
        }
        ++calls_;
        for (std::size_t i = 0; i < len; ++i) {
            out[i] = value_++;
        }
    }

    std::size_t calls()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

  private:
    std::mutex mutex_;
    std::size_t budget_;
    std::size_t calls_ = 0;
    std::uint8_t value_;
};

/**
 * @brief Always fails.
 */
class FailingRandom : public infra::RandomSource {
  public:
    void fill(std::uint8_t*, std::size_t) override
    {
        throw core::RandomSourceExhausted("stub source is empty");
    }
};

/**
 * @brief Counting bytes that can be switched off and on again.
 */
class SwitchableRandom : public infra::RandomSource {
  public:
    void fill(std::uint8_t* out, std::size_t len) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            throw core::RandomSourceExhausted("switched off");
        }
        for (std::size_t i = 0; i < len; ++i) {
            out[i] = value_++;
        }
    }

    void set_failing(bool failing)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

  private:
    std::mutex mutex_;
    bool failing_ = false;
    std::uint8_t value_ = 0;
};

/**
 * @brief Returns a configurable address and counts lookups.
 */
class StubHardwareAddress : public infra::HardwareAddressSource {
  public:
    explicit StubHardwareAddress(infra::HardwareAddress addr) : addr_(addr) {}

    infra::HardwareAddress address() override
    {
        ++lookups_;
        return addr_;
    }

    void set(infra::HardwareAddress addr) { addr_ = addr; }
    int lookups() const { return lookups_; }

  private:
    infra::HardwareAddress addr_;
    int lookups_ = 0;
};

/**
 * @brief Reports that no usable interface exists.
 */
class MissingHardwareAddress : public infra::HardwareAddressSource {
  public:
    infra::HardwareAddress address() override
    {
        ++lookups_;
        throw core::HardwareAddressNotFound("no interfaces in stub");
    }

    int lookups() const { return lookups_; }

  private:
    int lookups_ = 0;
};

} // namespace kairos::test
