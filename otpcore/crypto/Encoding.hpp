/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#ifndef OTPCORE_CRYPTO_ENCODING_HPP
#define OTPCORE_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpcore {

/**
 * Decodes a base-32 string using the rfc4648 alphabet.
 *
 * The decoder is liberal in what it accepts, the way authenticator
 * apps are: letters may be lowercase, spaces and '=' padding may
 * appear anywhere and are ignored, and the input need not be a
 * multiple of 8 characters long. Leftover bits that do not fill
 * a whole byte are dropped.
 *
 * Fails with OTP_CC_InvalidSecret on any other character.
 */
Status
base32Decode(DataChunk &result, const std::string &in);

/**
 * Encodes data into a hex string.
 */
std::string
base16Encode(DataSlice data);

} // namespace otpcore

#endif
