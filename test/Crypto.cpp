/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "../otpcore/crypto/Crypto.hpp"
#include "../otpcore/crypto/Encoding.hpp"
#include <catch.hpp>

TEST_CASE("RFC 2202 HMAC-SHA1 test vectors", "[crypto][hmac]")
{
    struct TestCase
    {
        std::string key;
        std::string data;
        const char *digest;
    };
    TestCase cases[] =
    {
        {
            std::string(20, '\x0b'),
            "Hi There",
            "b617318655057264e28bc0b6fb378c8ef146be00"
        },
        {
            "Jefe",
            "what do ya want for nothing?",
            "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79"
        },
        {
            std::string(20, '\xaa'),
            std::string(50, '\xdd'),
            "125d7342b9ac11cd91a39af48aa17b4f63f175d3"
        },
        {
            // Keys longer than the block size get hashed first:
            std::string(80, '\xaa'),
            "Test Using Larger Than Block-Size Key - Hash Key First",
            "aa4ae5e15272d00e95705637ce8a3b55ed402112"
        }
    };

    for (auto &test: cases)
    {
        auto digest = otpcore::hmacSha1(test.key, test.data);
        CHECK(otpcore::base16Encode(digest) == test.digest);
    }
}

TEST_CASE("HMAC-SHA1 with an empty key", "[crypto][hmac]")
{
    otpcore::DataChunk key;
    otpcore::DataChunk data;
    CHECK(otpcore::base16Encode(otpcore::hmacSha1(key, data)) ==
          "fbdb1d1b18aa6c08324b7d64b71fb76370690e1d");

    otpcore::DataArray<8> zeros = {{0}};
    CHECK(otpcore::base16Encode(otpcore::hmacSha1(key, zeros)) ==
          "dab69ad98e28764f977ee2487e4f3f6873b2a297");
}
