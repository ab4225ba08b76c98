/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#ifndef OTPCORE_CRYPTO_OTPKEY_HPP
#define OTPCORE_CRYPTO_OTPKEY_HPP

#include "Crypto.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpcore {

#define OTP_DIGITS 6

/**
 * Encodes a moving factor as the 8-byte big-endian message
 * that rfc4226 feeds to the HMAC.
 */
DataArray<8>
otpCounterBlock(uint64_t counter);

/**
 * The rfc4226 dynamic truncation.
 * Picks 4 bytes at an offset given by the low nibble of the last byte,
 * and returns them as a 31-bit big-endian integer.
 */
uint32_t
otpTruncate(const DataArray<SHA1_LENGTH> &hmac);

/**
 * Reduces a truncated value to a zero-padded decimal code.
 */
std::string
otpFormat(uint32_t value);

/**
 * Implements the HOTP algorithm defined by rfc4226.
 */
class OtpKey
{
public:
    OtpKey() {}
    OtpKey(DataSlice key): key_(key.begin(), key.end()) {}

    /**
     * Initializes the key with a base32-encoded string.
     */
    Status
    decodeBase32(const std::string &key);

    /**
     * Produces a counter-based password.
     */
    std::string
    hotp(uint64_t counter) const;

    /**
     * Obtains access to the underlying binary key.
     */
    DataSlice
    key() const { return key_; }

private:
    DataChunk key_;
};

} // namespace otpcore

#endif
