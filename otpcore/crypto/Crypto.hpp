/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */
/**
 * @file
 * Keyed-hash wrappers around OpenSSL.
 */

#ifndef OTPCORE_CRYPTO_CRYPTO_HPP
#define OTPCORE_CRYPTO_CRYPTO_HPP

#include "../util/Data.hpp"

namespace otpcore {

#define SHA1_LENGTH 20

/**
 * Computes HMAC-SHA1 as defined by rfc2104.
 * Keys of any length are accepted, including empty ones.
 */
DataArray<SHA1_LENGTH>
hmacSha1(DataSlice key, DataSlice data);

} // namespace otpcore

#endif
