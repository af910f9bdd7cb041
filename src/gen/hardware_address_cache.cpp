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
 * @file hardware_address_cache.cpp
 * @brief Implementation of the resolve-once node cache.
 */

#include "kairos/gen/hardware_address_cache.hpp"

#include "kairos/core/errors.hpp"
#include "kairos/infra/logger.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace kairos::gen {

namespace {

std::string format_address(const infra::HardwareAddress& addr)
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < addr.size(); ++i) {
        if (i > 0) {
            ss << ":";
        }
        ss << std::setw(2) << static_cast<int>(addr[i]);
    }
    return ss.str();
}

} // namespace

HardwareAddressCache::HardwareAddressCache(std::shared_ptr<infra::HardwareAddressSource> source,
                                           std::shared_ptr<infra::RandomSource> random)
    : source_(std::move(source)), random_(std::move(random)), resolved_(false), address_{}
{
}

infra::HardwareAddress HardwareAddressCache::resolve()
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (resolved_) {
        return address_;
    }

    try {
        address_ = source_->address();
        resolved_ = true;
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Node: Using hardware address " + format_address(address_));
        return address_;
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Node: Hardware address lookup failed (" + std::string(e.what()) +
                               "). Falling back to a random node.");
    }

    infra::HardwareAddress random_node;
    try {
        random_->fill(random_node.data(), random_node.size());
    } catch (const core::RandomSourceExhausted& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Node: Random fallback failed: " + std::string(e.what()));
        throw core::HardwareAddressUnavailable(e.what());
    }

    // Multicast bit set: not a real IEEE 802 address.
    random_node[0] |= 0x01;

    address_ = random_node;
    resolved_ = true;
    return address_;
}

} // namespace kairos::gen
