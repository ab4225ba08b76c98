/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "OtpKey.hpp"
#include "Encoding.hpp"
#include <sstream>

namespace otpcore {

DataArray<8>
otpCounterBlock(uint64_t counter)
{
    DataArray<8> out =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    return out;
}

uint32_t
otpTruncate(const DataArray<SHA1_LENGTH> &hmac)
{
    // The offset is at most 15, so offset + 3 stays inside 20 bytes:
    unsigned offset = hmac[SHA1_LENGTH - 1] & 0xf;
    return (static_cast<uint32_t>(hmac[offset] & 0x7f) << 24) |
        (static_cast<uint32_t>(hmac[offset + 1]) << 16) |
        (static_cast<uint32_t>(hmac[offset + 2]) << 8) |
        static_cast<uint32_t>(hmac[offset + 3]);
}

std::string
otpFormat(uint32_t value)
{
    uint32_t modulus = 1;
    for (unsigned i = 0; i < OTP_DIGITS; ++i)
        modulus *= 10;

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(OTP_DIGITS);
    ss.fill('0');
    ss << value % modulus;
    return ss.str();
}

Status
OtpKey::decodeBase32(const std::string &key)
{
    OTP_CHECK(base32Decode(key_, key));
    return Status();
}

std::string
OtpKey::hotp(uint64_t counter) const
{
    return otpFormat(otpTruncate(hmacSha1(key_, otpCounterBlock(counter))));
}

} // namespace otpcore
