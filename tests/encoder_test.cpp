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
 * @file encoder_test.cpp
 * @brief Byte layout tests for every version, checked against RFC-9562 Appendix A.
 *
 * @details
 * The Appendix A examples share one instant (2022-02-22 19:22:22 UTC), which is
 * `0x1EC9414C232AB00` Gregorian ticks and `0x017F22E279B0` Unix milliseconds.
 */

#include "framework.hpp"
#include "kairos/core/uuid.hpp"
#include "kairos/gen/encoder.hpp"
#include "kairos/gen/timestamp.hpp"
#include "stubs.hpp"

#include <cstdint>
#include <string>

using kairos::core::Namespace;
using kairos::core::Uuid;
using kairos::core::Variant;
using kairos::gen::Encoder;
using kairos::gen::RandomTail;

namespace {

const std::uint64_t EXAMPLE_TICKS = 0x1EC9414C232AB00;
const std::uint64_t EXAMPLE_MILLIS = 0x017F22E279B0;

} // namespace

void test_timestamp_conversions()
{
    auto t = kairos::test::at_millis(EXAMPLE_MILLIS);
    ASSERT_EQ(kairos::gen::to_gregorian_ticks(t), EXAMPLE_TICKS);
    ASSERT_EQ(kairos::gen::to_unix_millis(t), EXAMPLE_MILLIS);
    ASSERT_EQ(kairos::gen::to_gregorian_ticks(kairos::test::at_millis(0)),
              kairos::gen::GREGORIAN_EPOCH_OFFSET);
}

void test_encode_v1_rfc_vector()
{
    Uuid u = Encoder::v1(EXAMPLE_TICKS, 0x33C8, {0x9F, 0x6B, 0xDE, 0xCE, 0xD8, 0x46});
    ASSERT_EQ(u.to_string(), std::string("c232ab00-9414-11ec-b3c8-9f6bdeced846"));
    ASSERT_EQ(u.version(), 1);
}

/**
 * @brief Name-based layouts hash `namespace || name`; the v5 SHA-1 digest is truncated.
 */
void test_encode_v3_v5_rfc_vectors()
{
    Uuid v3 = Encoder::v3(Namespace::DNS, "www.example.com");
    Uuid v5 = Encoder::v5(Namespace::DNS, "www.example.com");

    ASSERT_EQ(v3.to_string(), std::string("5df41881-3aed-3515-88a7-2f4a814cf09e"));
    ASSERT_EQ(v5.to_string(), std::string("2ed6657d-e927-568b-95e1-2665a8aea6a2"));
    ASSERT_TRUE(v3.variant() == Variant::RFC9562);
    ASSERT_TRUE(v5.variant() == Variant::RFC9562);
}

void test_encode_v4_rfc_vector()
{
    Uuid::Bytes raw{0x91, 0x91, 0x08, 0xf7, 0x52, 0xd1, 0x43, 0x20,
                    0x9b, 0xac, 0xf8, 0x47, 0xdb, 0x41, 0x48, 0xa8};
    ASSERT_EQ(Encoder::v4(raw).to_string(), std::string("919108f7-52d1-4320-9bac-f847db4148a8"));

    Uuid::Bytes zero{};
    ASSERT_EQ(Encoder::v4(zero).to_string(), std::string("00000000-0000-4000-8000-000000000000"));
}

void test_encode_v6_rfc_vector()
{
    RandomTail tail{0x33, 0xC8, 0x9F, 0x6B, 0xDE, 0xCE, 0xD8, 0x46};
    Uuid u = Encoder::v6(EXAMPLE_TICKS, tail);
    ASSERT_EQ(u.to_string(), std::string("1ec9414c-232a-6b00-b3c8-9f6bdeced846"));
}

void test_encode_v7_rfc_vector()
{
    RandomTail tail{0x18, 0xC4, 0xDC, 0x0C, 0x0C, 0x07, 0x39, 0x8F};
    Uuid u = Encoder::v7(EXAMPLE_MILLIS, 0x0CC3, tail);
    ASSERT_EQ(u.to_string(), std::string("017f22e2-79b0-7cc3-98c4-dc0c0c07398f"));
}

/**
 * @brief v6 keeps the Gregorian timestamp in most-significant-first order,
 * so later ticks always sort later.
 */
void test_encode_v6_sorts_by_time()
{
    RandomTail high;
    high.fill(0xFF);
    RandomTail low{};

    Uuid earlier = Encoder::v6(EXAMPLE_TICKS, high);
    Uuid later = Encoder::v6(EXAMPLE_TICKS + 1, low);
    ASSERT_TRUE(earlier < later);

    Uuid across_field = Encoder::v6(EXAMPLE_TICKS | 0x0FFF, high);
    Uuid next_mid = Encoder::v6((EXAMPLE_TICKS | 0x0FFF) + 1, low);
    ASSERT_TRUE(across_field < next_mid);
}
