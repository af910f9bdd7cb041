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
 * @file encoder.cpp
 * @brief Implementation of the per-version byte layouts.
 *
 * @details
 * All multi-octet fields are written big-endian, as RFC-9562 requires.
 */

#include "kairos/gen/encoder.hpp"

#include "kairos/infra/digest.hpp"

#include <algorithm>
#include <vector>

namespace kairos::gen {

namespace {

void put_be16(core::Uuid& u, std::size_t offset, std::uint16_t v)
{
    u[offset] = static_cast<std::uint8_t>(v >> 8);
    u[offset + 1] = static_cast<std::uint8_t>(v);
}

void put_be32(core::Uuid& u, std::size_t offset, std::uint32_t v)
{
    u[offset] = static_cast<std::uint8_t>(v >> 24);
    u[offset + 1] = static_cast<std::uint8_t>(v >> 16);
    u[offset + 2] = static_cast<std::uint8_t>(v >> 8);
    u[offset + 3] = static_cast<std::uint8_t>(v);
}

/**
 * @brief Hashes `ns || name` and keeps the first 16 octets.
 *
 * SHA-1 yields 20 octets; the trailing 4 are discarded.
 */
core::Uuid from_hash(infra::Digest::Algorithm algorithm, const core::Uuid& ns,
                     std::string_view name)
{
    infra::Digest digest(algorithm);
    digest.update(ns.bytes().data(), ns.bytes().size());
    digest.update(name.data(), name.size());
    std::vector<std::uint8_t> sum = digest.finish();

    core::Uuid::Bytes bytes{};
    std::copy_n(sum.begin(), std::min(sum.size(), bytes.size()), bytes.begin());
    return core::Uuid(bytes);
}

/// @brief Stamps version and variant; the last step of every layout.
core::Uuid finalize(core::Uuid u, int version)
{
    u.set_version(version);
    u.set_variant_rfc9562();
    return u;
}

} // namespace

core::Uuid Encoder::v1(std::uint64_t ticks, std::uint16_t clock_sequence,
                       const infra::HardwareAddress& node)
{
    core::Uuid u;

    put_be32(u, 0, static_cast<std::uint32_t>(ticks));
    put_be16(u, 4, static_cast<std::uint16_t>(ticks >> 32));
    put_be16(u, 6, static_cast<std::uint16_t>(ticks >> 48));
    put_be16(u, 8, clock_sequence);

    for (std::size_t i = 0; i < node.size(); ++i) {
        u[10 + i] = node[i];
    }

    return finalize(u, 1);
}

core::Uuid Encoder::v3(const core::Uuid& ns, std::string_view name)
{
    return finalize(from_hash(infra::Digest::Algorithm::MD5, ns, name), 3);
}

core::Uuid Encoder::v4(const core::Uuid::Bytes& random)
{
    return finalize(core::Uuid(random), 4);
}

core::Uuid Encoder::v5(const core::Uuid& ns, std::string_view name)
{
    return finalize(from_hash(infra::Digest::Algorithm::SHA1, ns, name), 5);
}

core::Uuid Encoder::v6(std::uint64_t ticks, const RandomTail& random)
{
    /* RFC-9562 section 5.6:
     *  | time_high (32) | time_mid (16) | ver (4) time_low (12) |
     *  | var (2) clock_seq (14) | node (48)                      |
     * clock_seq and node are filled with random bits instead of a counter/MAC. */
    core::Uuid u;

    put_be32(u, 0, static_cast<std::uint32_t>(ticks >> 28));
    put_be16(u, 4, static_cast<std::uint16_t>(ticks >> 12));
    put_be16(u, 6, static_cast<std::uint16_t>(ticks & 0x0FFF));

    std::copy(random.begin(), random.end(), &u[8]);

    return finalize(u, 6);
}

core::Uuid Encoder::v7(std::uint64_t unix_ms, std::uint16_t sequence, const RandomTail& random)
{
    /* RFC-9562 section 5.7:
     *  | unix_ts_ms (48) | ver (4) rand_a (12) | var (2) rand_b (62) |
     * rand_a carries the low 12 bits of the sequence (section 6.2, method 1). */
    core::Uuid u;

    for (int i = 0; i < 6; ++i) {
        u[i] = static_cast<std::uint8_t>(unix_ms >> (40 - 8 * i));
    }
    put_be16(u, 6, sequence);

    std::copy(random.begin(), random.end(), &u[8]);

    return finalize(u, 7);
}

} // namespace kairos::gen
