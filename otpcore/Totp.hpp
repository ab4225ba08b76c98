/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */
/**
 * @file
 * Time-based one-time passwords, as defined by rfc6238.
 *
 * Secrets are base32 strings in the format authenticator apps use:
 * the letters A-Z and digits 2-7, case-insensitive,
 * with optional spaces and '=' padding.
 * Codes are 6 decimal digits over a 30-second window, using HMAC-SHA1.
 */

#ifndef OTPCORE_TOTP_HPP
#define OTPCORE_TOTP_HPP

#include "util/Status.hpp"
#include <stdint.h>
#include <time.h>
#include <string>

namespace otpcore {

class Interrupt;

#define TOTP_PERIOD 30
#define TOTP_DEFAULT_MIN_VALID 5

/**
 * The source of wall-clock time for code generation.
 */
class TotpClock
{
public:
    virtual ~TotpClock();

    /**
     * Returns the current unix time, in seconds.
     */
    virtual time_t
    now() = 0;

    /**
     * Blocks the calling thread for the given number of seconds.
     * If `interrupt` is non-null and gets triggered,
     * returns early with OTP_CC_Interrupted.
     */
    virtual Status
    sleep(unsigned seconds, Interrupt *interrupt) = 0;
};

/**
 * The real system clock.
 */
TotpClock &
systemClock();

/**
 * Returns the time-step counter for a unix time.
 */
uint64_t
totpCounter(time_t now);

/**
 * Returns the number of seconds until the window containing `now` ends,
 * in the range [1, TOTP_PERIOD].
 * Callers that cannot block can poll this instead of calling `generateCode`.
 */
unsigned
totpSecondsRemaining(time_t now);

/**
 * Computes the code for a specific time-step counter.
 */
Status
computeCodeForCounter(std::string &result, const std::string &secret,
    uint64_t counter);

/**
 * Computes the code for the current time window, without any waiting.
 */
Status
computeCode(std::string &result, const std::string &secret);

Status
computeCode(std::string &result, const std::string &secret,
    TotpClock &clock);

/**
 * Computes a code that stays valid for at least `minValidSeconds`.
 *
 * If the current window has less time than that left,
 * this function sleeps until the next window begins,
 * so it can block for up to TOTP_PERIOD seconds.
 *
 * @param minValidSeconds Must lie in [1, TOTP_PERIOD],
 * or the call fails with OTP_CC_InvalidConfiguration before doing anything.
 * @param interrupt Optional. Triggering it aborts the wait,
 * and the call fails with OTP_CC_Interrupted.
 */
Status
generateCode(std::string &result, const std::string &secret,
    int minValidSeconds=TOTP_DEFAULT_MIN_VALID, Interrupt *interrupt=nullptr);

Status
generateCode(std::string &result, const std::string &secret,
    int minValidSeconds, Interrupt *interrupt, TotpClock &clock);

} // namespace otpcore

#endif
