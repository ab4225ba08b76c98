/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "Encoding.hpp"
#include <ctype.h>
#include <utility>

namespace otpcore {

Status
base32Decode(DataChunk &result, const std::string &in)
{
    DataChunk out;
    out.reserve(5 * in.size() / 8);

    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    for (char c: in)
    {
        // Spaces and padding carry no data:
        if (' ' == c || '=' == c)
            continue;

        // Read one character from the string:
        c = toupper(static_cast<unsigned char>(c));
        int value = 0;
        if ('A' <= c && c <= 'Z')
            value = c - 'A';
        else if ('2' <= c && c <= '7')
            value = 26 + c - '2';
        else
            return OTP_ERROR(OTP_CC_InvalidSecret,
                "Invalid base32 character: " + std::string(1, c));

        // Append the bits to the buffer:
        buffer |= value << (11 - bits);
        bits += 5;

        // Write out some bits if the buffer has a byte's worth:
        if (8 <= bits)
        {
            out.push_back(buffer >> 8);
            buffer <<= 8;
            bits -= 8;
        }
    }

    // Any bits left in the buffer are an incomplete byte, so drop them.

    result = std::move(out);
    return Status();
}

std::string
base16Encode(DataSlice data)
{
    const char base16Sym[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * data.size());

    for (auto byte: data)
    {
        out += base16Sym[byte >> 4];
        out += base16Sym[byte & 0xf];
    }
    return out;
}

} // namespace otpcore
