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
 * @file digest.hpp
 * @brief Message digests for the name-based versions (MD5 for v3, SHA-1 for v5).
 *
 * @details
 * A thin RAII wrapper around the OpenSSL EVP interface. Neither algorithm is
 * used for security here; they only provide the deterministic mapping from
 * (namespace, name) to identifier bits that RFC-9562 prescribes.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Defined in <openssl/evp.h>.
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace kairos::infra {

/**
 * @class Digest
 * @brief An incremental hash computation.
 *
 * @code
 * // Example Usage:
 * Digest d(Digest::Algorithm::SHA1);
 * d.update(ns.bytes().data(), ns.bytes().size());
 * d.update(name.data(), name.size());
 * std::vector<std::uint8_t> sum = d.finish();
 * @endcode
 */
class Digest {
  public:
    enum class Algorithm {
        MD5, ///< 16-byte output.
        SHA1 ///< 20-byte output.
    };

    /**
     * @brief Initialises a fresh digest context.
     * @throws kairos::core::DigestError If the context cannot be created.
     */
    explicit Digest(Algorithm algorithm);

    /// @brief Feeds `len` bytes into the digest.
    void update(const void* data, std::size_t len);

    /**
     * @brief Completes the computation.
     *
     * @return std::vector<std::uint8_t> The full digest (16 or 20 bytes).
     * @note The object must not be updated again afterwards.
     */
    std::vector<std::uint8_t> finish();

  private:
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx_;
};

} // namespace kairos::infra
