/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "Totp.hpp"
#include "crypto/OtpKey.hpp"
#include "util/Debug.hpp"
#include "util/Interrupt.hpp"
#include <chrono>
#include <thread>

namespace otpcore {

TotpClock::~TotpClock()
{
}

/**
 * Reads the time from the operating system.
 */
class SystemClock:
    public TotpClock
{
public:
    time_t
    now() override
    {
        return std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::now());
    }

    Status
    sleep(unsigned seconds, Interrupt *interrupt) override
    {
        if (interrupt)
            return interrupt->sleep(std::chrono::seconds(seconds));

        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        return Status();
    }
};

TotpClock &
systemClock()
{
    static SystemClock clock;
    return clock;
}

uint64_t
totpCounter(time_t now)
{
    return static_cast<uint64_t>(now) / TOTP_PERIOD;
}

unsigned
totpSecondsRemaining(time_t now)
{
    return TOTP_PERIOD - static_cast<uint64_t>(now) % TOTP_PERIOD;
}

Status
computeCodeForCounter(std::string &result, const std::string &secret,
    uint64_t counter)
{
    OtpKey key;
    OTP_CHECK(key.decodeBase32(secret));

    result = key.hotp(counter);
    return Status();
}

Status
computeCode(std::string &result, const std::string &secret)
{
    return computeCode(result, secret, systemClock());
}

Status
computeCode(std::string &result, const std::string &secret,
    TotpClock &clock)
{
    return computeCodeForCounter(result, secret, totpCounter(clock.now()));
}

Status
generateCode(std::string &result, const std::string &secret,
    int minValidSeconds, Interrupt *interrupt)
{
    return generateCode(result, secret, minValidSeconds, interrupt,
        systemClock());
}

Status
generateCode(std::string &result, const std::string &secret,
    int minValidSeconds, Interrupt *interrupt, TotpClock &clock)
{
    if (minValidSeconds < 1 || TOTP_PERIOD < minValidSeconds)
        return OTP_ERROR(OTP_CC_InvalidConfiguration,
            "minValidSeconds must be between 1 and " +
            std::to_string(TOTP_PERIOD));

    // Reject a bad secret before spending up to a full window waiting:
    OtpKey key;
    OTP_CHECK(key.decodeBase32(secret));

    unsigned remaining = totpSecondsRemaining(clock.now());
    if (remaining < static_cast<unsigned>(minValidSeconds))
    {
        OTP_DebugLog("TOTP window closes in %u s, waiting for the next one",
            remaining);
        Status s = clock.sleep(remaining, interrupt);
        if (!s)
        {
            OTP_DebugLog("TOTP wait aborted");
            return s;
        }
    }

    // The wait moved us forward, so the clock must be read again:
    result = key.hotp(totpCounter(clock.now()));
    return Status();
}

} // namespace otpcore
