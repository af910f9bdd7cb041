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
 * @file uuid.cpp
 * @brief Implementation of the identifier value type and its canonical formatting.
 */

#include "kairos/core/uuid.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace kairos::core {

namespace {

/// @brief Builds the RFC-9562 namespace family `6ba7b81X-9dad-11d1-80b4-00c04fd430c8`.
Uuid make_namespace(std::uint8_t low)
{
    return Uuid(Uuid::Bytes{0x6b, 0xa7, 0xb8, low, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00,
                            0xc0, 0x4f, 0xd4, 0x30, 0xc8});
}

} // namespace

const Uuid Namespace::DNS = make_namespace(0x10);
const Uuid Namespace::URL = make_namespace(0x11);
const Uuid Namespace::OID = make_namespace(0x12);
const Uuid Namespace::X500 = make_namespace(0x14);

int Uuid::version() const
{
    return bytes_[6] >> 4;
}

Variant Uuid::variant() const
{
    std::uint8_t octet = bytes_[8];
    if ((octet & 0x80) == 0x00) {
        return Variant::NCS;
    }
    if ((octet & 0xC0) == 0x80) {
        return Variant::RFC9562;
    }
    if ((octet & 0xE0) == 0xC0) {
        return Variant::MICROSOFT;
    }
    return Variant::FUTURE;
}

bool Uuid::is_nil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

void Uuid::set_version(int version)
{
    bytes_[6] = static_cast<std::uint8_t>((bytes_[6] & 0x0F) | ((version & 0x0F) << 4));
}

void Uuid::set_variant_rfc9562()
{
    // Variant 10xx xxxx: keep the low six bits of octet 8.
    bytes_[8] = static_cast<std::uint8_t>((bytes_[8] & 0x3F) | 0x80);
}

/**
 * @brief Formats the identifier as 8-4-4-4-12 hexadecimal groups.
 *
 * Hyphens are emitted before octets 4, 6, 8 and 10.
 */
std::string Uuid::to_string() const
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < size; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << "-";
        }
        ss << std::setw(2) << static_cast<int>(bytes_[i]);
    }

    return ss.str();
}

bool operator==(const Uuid& lhs, const Uuid& rhs)
{
    return lhs.bytes() == rhs.bytes();
}

bool operator!=(const Uuid& lhs, const Uuid& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const Uuid& lhs, const Uuid& rhs)
{
    return lhs.bytes() < rhs.bytes();
}

std::ostream& operator<<(std::ostream& out, const Uuid& uuid)
{
    return out << uuid.to_string();
}

} // namespace kairos::core
