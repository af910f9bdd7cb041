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
 * @file uuid.hpp
 * @brief The 16-byte RFC-9562 identifier value type.
 *
 * @details
 * This file declares `Uuid`, the immutable result type of every generator in
 * Kairos. It stores the raw big-endian octets exactly as they are laid out on
 * the wire, so byte-wise comparison is also issuance-order comparison for the
 * k-sortable versions (6 and 7).
 */

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace kairos::core {

/**
 * @enum Variant
 * @brief The layout family encoded in the top bits of octet 8.
 */
enum class Variant {
    NCS,       ///< `0xx`: reserved, NCS backward compatibility.
    RFC9562,   ///< `10x`: the layout produced by this library.
    MICROSOFT, ///< `110`: reserved, Microsoft backward compatibility.
    FUTURE     ///< `111`: reserved for future definition.
};

/**
 * @class Uuid
 * @brief A fixed 16-octet universally unique identifier.
 *
 * @details
 * A default-constructed `Uuid` is the Nil UUID (all zeros). Generators build
 * values through the encoder and then hand them out by value; callers never
 * mutate a produced identifier.
 */
class Uuid {
  public:
    static constexpr std::size_t size = 16;

    using Bytes = std::array<std::uint8_t, size>;

    Uuid() : bytes_{} {}

    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief Raw octets, network byte order.
    const Bytes& bytes() const { return bytes_; }

    /**
     * @brief Returns the version nibble (bits 48-51).
     *
     * @return int A value in `[0, 15]`. Identifiers produced by Kairos are
     * always one of `{1, 3, 4, 5, 6, 7}`.
     */
    int version() const;

    /// @brief Decodes the variant bits of octet 8.
    Variant variant() const;

    /// @brief True for the all-zero Nil UUID.
    bool is_nil() const;

    /**
     * @brief Overwrites the version nibble, keeping the low nibble of octet 6.
     * @param version The version number (1-15).
     */
    void set_version(int version);

    /// @brief Overwrites the top two bits of octet 8 with `10`.
    void set_variant_rfc9562();

    /**
     * @brief Renders the canonical textual form.
     *
     * `xxxxxxxx-xxxx-Vxxx-yxxx-xxxxxxxxxxxx`, lower-case hexadecimal.
     *
     * @code
     * // Example Usage:
     * std::string text = generator.new_v4().to_string();
     * @endcode
     */
    std::string to_string() const;

    /// @brief Mutable access for the encoder while an identifier is being assembled.
    std::uint8_t& operator[](std::size_t index) { return bytes_[index]; }
    std::uint8_t operator[](std::size_t index) const { return bytes_[index]; }

  private:
    Bytes bytes_;
};

bool operator==(const Uuid& lhs, const Uuid& rhs);
bool operator!=(const Uuid& lhs, const Uuid& rhs);

/**
 * @brief Byte-lexicographic ordering.
 *
 * For versions 6 and 7 this is the issuance order; batches issued by
 * `MonotonicGenerator` are strictly increasing under this relation.
 */
bool operator<(const Uuid& lhs, const Uuid& rhs);

std::ostream& operator<<(std::ostream& out, const Uuid& uuid);

/**
 * @struct Namespace
 * @brief Well-known namespace identifiers for name-based versions 3 and 5.
 */
struct Namespace {
    static const Uuid DNS;  ///< `6ba7b810-9dad-11d1-80b4-00c04fd430c8`
    static const Uuid URL;  ///< `6ba7b811-9dad-11d1-80b4-00c04fd430c8`
    static const Uuid OID;  ///< `6ba7b812-9dad-11d1-80b4-00c04fd430c8`
    static const Uuid X500; ///< `6ba7b814-9dad-11d1-80b4-00c04fd430c8`
};

} // namespace kairos::core
