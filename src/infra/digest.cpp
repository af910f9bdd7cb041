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
 * @file digest.cpp
 * @brief OpenSSL EVP implementation of the `Digest` wrapper.
 */

#include "kairos/infra/digest.hpp"

#include "kairos/core/errors.hpp"

#include <openssl/evp.h>

namespace kairos::infra {

Digest::Digest(Algorithm algorithm) : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
{
    if (!ctx_) {
        throw core::DigestError("EVP_MD_CTX_new returned null");
    }

    const EVP_MD* md = (algorithm == Algorithm::MD5) ? EVP_md5() : EVP_sha1();
    if (EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
        throw core::DigestError("EVP_DigestInit_ex failed");
    }
}

void Digest::update(const void* data, std::size_t len)
{
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw core::DigestError("EVP_DigestUpdate failed");
    }
}

std::vector<std::uint8_t> Digest::finish()
{
    std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
        throw core::DigestError("EVP_DigestFinal_ex failed");
    }

    out.resize(len);
    return out;
}

} // namespace kairos::infra
