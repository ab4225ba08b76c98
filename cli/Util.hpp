/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */
/**
 * @file
 * Utilities and helpers shared between commands.
 */

#ifndef CLI_UTIL_HPP
#define CLI_UTIL_HPP

#include "../otpcore/util/Interrupt.hpp"
#include <stdint.h>
#include <atomic>
#include <thread>

struct Session;

/**
 * Turns ctrl-c into an otpcore::Interrupt trigger for as long as it lives.
 *
 * SIGINT is blocked and collected by a helper thread with sigwait,
 * since condition variables cannot be touched from a signal handler.
 * Construct this before starting any other threads,
 * so they inherit the blocked signal mask.
 */
class InterruptThread
{
public:
    ~InterruptThread();

    otpcore::Status
    init(otpcore::Interrupt &interrupt);

private:
    std::atomic<bool> done_{false};
    std::thread *thread_ = nullptr;
    bool masked_ = false;
};

/**
 * Picks the secret from the command line if given,
 * otherwise from the session.
 */
otpcore::Status
secretGet(std::string &result, const Session &session, const char *arg);

/**
 * Parses a decimal number, rejecting junk.
 */
otpcore::Status
parseUnsigned(uint64_t &result, const char *text);

#endif
