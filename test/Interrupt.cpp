/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "../otpcore/util/Interrupt.hpp"
#include <catch.hpp>
#include <chrono>
#include <thread>

TEST_CASE("Interrupt sleeps", "[util][interrupt]")
{
    otpcore::Interrupt interrupt;
    REQUIRE_FALSE(interrupt.triggered());

    SECTION("runs out normally")
    {
        REQUIRE(interrupt.sleep(std::chrono::milliseconds(10)));
        REQUIRE_FALSE(interrupt.triggered());
    }
    SECTION("already triggered")
    {
        interrupt.trigger();
        REQUIRE(interrupt.triggered());

        auto s = interrupt.sleep(std::chrono::milliseconds(10000));
        REQUIRE(otpcore::OTP_CC_Interrupted == s.value());
    }
    SECTION("triggered from another thread")
    {
        auto start = std::chrono::steady_clock::now();
        std::thread thread([&interrupt]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            interrupt.trigger();
        });

        auto s = interrupt.sleep(std::chrono::seconds(30));
        thread.join();
        REQUIRE(otpcore::OTP_CC_Interrupted == s.value());
        REQUIRE(std::chrono::steady_clock::now() - start <
                std::chrono::seconds(10));
    }
    SECTION("reset")
    {
        interrupt.trigger();
        interrupt.reset();
        REQUIRE_FALSE(interrupt.triggered());
        REQUIRE(interrupt.sleep(std::chrono::milliseconds(1)));
    }
}
