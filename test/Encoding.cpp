/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "../otpcore/crypto/Encoding.hpp"
#include <catch.hpp>

TEST_CASE("RFC 4648 base32 test vectors", "[crypto][base32]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "MY======"},
        {"fo", "MZXQ===="},
        {"foo", "MZXW6==="},
        {"foob", "MZXW6YQ="},
        {"fooba", "MZXW6YTB"},
        {"foobar", "MZXW6YTBOI======"}
    };

    for (auto &test: cases)
    {
        otpcore::DataChunk result;
        REQUIRE(otpcore::base32Decode(result, test.text));
        REQUIRE(otpcore::toString(result) == test.data);
    }
}

TEST_CASE("Authenticator-style base32 input", "[crypto][base32]")
{
    otpcore::DataChunk expected;
    REQUIRE(otpcore::base32Decode(expected, "JBSWY3DP"));
    REQUIRE(otpcore::toString(expected) == "Hello");

    const char *cases[] =
    {
        "jbswy3dp",
        "jbsw y3dp",
        "JBSW Y3DP",
        "JBSWY3DP========",
        " J B S W Y 3 D P ",
        "JbSw=Y3dP"
    };
    for (auto test: cases)
    {
        otpcore::DataChunk result;
        REQUIRE(otpcore::base32Decode(result, test));
        REQUIRE(result == expected);
    }
}

TEST_CASE("Unpadded base32 drops trailing bits", "[crypto][base32]")
{
    otpcore::DataChunk result;

    // 5 bits is not enough for a byte:
    REQUIRE(otpcore::base32Decode(result, "M"));
    REQUIRE(result.empty());

    // 10 bits make one byte, with 2 left over:
    REQUIRE(otpcore::base32Decode(result, "MY"));
    REQUIRE(otpcore::toString(result) == "f");

    // 16 bytes of secret, as printed by most services:
    REQUIRE(otpcore::base32Decode(result, "JBSWY3DPEHPK3PXP"));
    REQUIRE(10 == result.size());
    REQUIRE(otpcore::base16Encode(result) == "48656c6c6f21deadbeef");
}

TEST_CASE("Empty base32 input", "[crypto][base32]")
{
    otpcore::DataChunk result(3, 0);
    REQUIRE(otpcore::base32Decode(result, ""));
    REQUIRE(result.empty());

    REQUIRE(otpcore::base32Decode(result, "  ==== "));
    REQUIRE(result.empty());
}

TEST_CASE("Bad base32 strings", "[crypto][base32]")
{
    otpcore::DataChunk result;

    // Illegal characters:
    auto s = otpcore::base32Decode(result, "JBSW1!DP");
    REQUIRE_FALSE(s);
    REQUIRE(otpcore::OTP_CC_InvalidSecret == s.value());
    REQUIRE(s.message() == "Invalid base32 character: 1");

    s = otpcore::base32Decode(result, "JBSWY3D!");
    REQUIRE(otpcore::OTP_CC_InvalidSecret == s.value());
    REQUIRE(s.message() == "Invalid base32 character: !");

    REQUIRE_FALSE(otpcore::base32Decode(result, "JBSW0Y3DP"));
    REQUIRE_FALSE(otpcore::base32Decode(result, "JBSW8Y3DP"));
    REQUIRE_FALSE(otpcore::base32Decode(result, "JBSW-Y3DP"));

    // Only plain spaces are ignored:
    REQUIRE_FALSE(otpcore::base32Decode(result, "JBSW\tY3DP"));
    REQUIRE_FALSE(otpcore::base32Decode(result, "JBSWY3DP\n"));
}

TEST_CASE("Failed decoding leaves the output alone", "[crypto][base32]")
{
    otpcore::DataChunk result(2, 7);
    REQUIRE_FALSE(otpcore::base32Decode(result, "MZXW6!"));
    REQUIRE(otpcore::DataChunk(2, 7) == result);
}

TEST_CASE("Base16 encoding", "[crypto][base16]")
{
    REQUIRE(otpcore::base16Encode(std::string("")) == "");
    REQUIRE(otpcore::base16Encode(std::string("foobar")) == "666f6f626172");

    otpcore::DataChunk data = {0x00, 0x0f, 0xf0, 0xff};
    REQUIRE(otpcore::base16Encode(data) == "000ff0ff");
}
