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
 * @file random_source.cpp
 * @brief OpenSSL-backed implementation of the default entropy provider.
 */

#include "kairos/infra/random_source.hpp"

#include "kairos/core/errors.hpp"

#include <climits>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <string>

namespace kairos::infra {

/**
 * @brief Draws `len` bytes from the OpenSSL DRBG.
 *
 * `RAND_bytes` takes an `int` length, so large requests are split into chunks.
 * A return value other than 1 means the generator is not (or no longer) seeded.
 */
void SystemRandomSource::fill(std::uint8_t* out, std::size_t len)
{
    while (len > 0) {
        int chunk = len > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);

        if (RAND_bytes(out, chunk) != 1) {
            char reason[256] = {};
            ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
            throw core::RandomSourceExhausted(std::string("RAND_bytes failed (") + reason + ")");
        }

        out += chunk;
        len -= static_cast<std::size_t>(chunk);
    }
}

} // namespace kairos::infra
