/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "../cli/Command.hpp"
#include "../cli/Util.hpp"
#include <catch.hpp>

TEST_CASE("Command-line numbers", "[cli]")
{
    uint64_t value = 7;

    SECTION("plain digits")
    {
        REQUIRE(parseUnsigned(value, "0"));
        REQUIRE(0 == value);
        REQUIRE(parseUnsigned(value, "30"));
        REQUIRE(30 == value);
        REQUIRE(parseUnsigned(value, "18446744073709551615"));
        REQUIRE(UINT64_MAX == value);
    }
    SECTION("junk is rejected")
    {
        const char *cases[] =
        {
            "", "-1", " -1", "\t-1", " 5", "+5", "5 ", "5x", "x",
            "18446744073709551616"
        };
        for (auto text: cases)
        {
            INFO("text: \"" << text << "\"");
            REQUIRE_FALSE(parseUnsigned(value, text));
        }
        REQUIRE(7 == value);
    }
}

TEST_CASE("Command-line secrets", "[cli]")
{
    Session session;
    std::string secret;

    REQUIRE_FALSE(secretGet(secret, session, nullptr));

    session.secret = "JBSWY3DP";
    REQUIRE(secretGet(secret, session, nullptr));
    REQUIRE(secret == "JBSWY3DP");

    REQUIRE(secretGet(secret, session, "GEZDGNBV"));
    REQUIRE(secret == "GEZDGNBV");
}
