/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../otpcore/Totp.hpp"
#include "../../otpcore/crypto/Encoding.hpp"
#include "../../otpcore/crypto/OtpKey.hpp"
#include <time.h>
#include <iostream>

using namespace otpcore;

COMMAND(OtpCode, "code", "[<secret>]")
{
    if (1 < argc)
        return OTP_ERROR(OTP_CC_Error, usage());

    std::string secret;
    OTP_CHECK(secretGet(secret, session, argc ? argv[0] : nullptr));

    std::string code;
    OTP_CHECK(computeCode(code, secret));
    std::cout << code << std::endl;

    return Status();
}

COMMAND(OtpGenerate, "generate", "[<secret>] [<min-valid-sec>]")
{
    if (2 < argc)
        return OTP_ERROR(OTP_CC_Error, usage());

    std::string secret;
    OTP_CHECK(secretGet(secret, session, argc ? argv[0] : nullptr));

    int minValidSeconds = session.minValidSeconds;
    if (2 == argc)
    {
        uint64_t value;
        OTP_CHECK(parseUnsigned(value, argv[1]));
        // Out-of-range values are left for generateCode to reject:
        minValidSeconds = value <= TOTP_PERIOD ?
            static_cast<int>(value) : TOTP_PERIOD + 1;
    }

    // The wait stops with ctrl-c:
    Interrupt interrupt;
    InterruptThread thread;
    OTP_CHECK(thread.init(interrupt));

    std::string code;
    OTP_CHECK(generateCode(code, secret, minValidSeconds, &interrupt));
    std::cout << code << std::endl;

    return Status();
}

COMMAND(OtpHotp, "hotp", "<secret> <counter>")
{
    if (argc != 2)
        return OTP_ERROR(OTP_CC_Error, usage());

    uint64_t counter;
    OTP_CHECK(parseUnsigned(counter, argv[1]));

    std::string code;
    OTP_CHECK(computeCodeForCounter(code, argv[0], counter));
    std::cout << code << std::endl;

    return Status();
}

COMMAND(OtpRemaining, "remaining", "")
{
    if (argc != 0)
        return OTP_ERROR(OTP_CC_Error, usage());

    time_t now = systemClock().now();
    std::cout << "counter: " << totpCounter(now) << std::endl;
    std::cout << "seconds left: " << totpSecondsRemaining(now) << std::endl;

    return Status();
}

COMMAND(OtpKeyDump, "key-dump", "[<secret>]")
{
    if (1 < argc)
        return OTP_ERROR(OTP_CC_Error, usage());

    std::string secret;
    OTP_CHECK(secretGet(secret, session, argc ? argv[0] : nullptr));

    OtpKey key;
    OTP_CHECK(key.decodeBase32(secret));
    std::cout << "bytes: " << key.key().size() << std::endl;
    std::cout << "key: " << base16Encode(key.key()) << std::endl;

    return Status();
}
