/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "Util.hpp"
#include "Command.hpp"
#include "../otpcore/util/Debug.hpp"
#include <ctype.h>
#include <errno.h>
#include <pthread.h>
#include <signal.h>
#include <stdlib.h>

using namespace otpcore;

static sigset_t
interruptSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    return set;
}

static void
interruptThread(std::atomic<bool> *done, Interrupt *interrupt)
{
    sigset_t set = interruptSignals();
    int signal = 0;
    while (!sigwait(&set, &signal))
    {
        if (*done)
            return;
        interrupt->trigger();
    }
}

InterruptThread::~InterruptThread()
{
    if (thread_)
    {
        // Wake the thread with its own signal so it can see the flag:
        done_ = true;
        if (pthread_kill(thread_->native_handle(), SIGINT))
            thread_->detach();
        else
            thread_->join();
        delete thread_;
    }

    if (masked_)
    {
        sigset_t set = interruptSignals();
        if (pthread_sigmask(SIG_UNBLOCK, &set, nullptr))
            OTP_DebugLog("Cannot unblock SIGINT");
    }
}

Status
InterruptThread::init(Interrupt &interrupt)
{
    sigset_t set = interruptSignals();
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr))
        return OTP_ERROR(OTP_CC_SysError, "Cannot block SIGINT");
    masked_ = true;

    thread_ = new std::thread(interruptThread, &done_, &interrupt);
    return Status();
}

Status
secretGet(std::string &result, const Session &session, const char *arg)
{
    if (arg)
        result = arg;
    else if (!session.secret.empty())
        result = session.secret;
    else
        return OTP_ERROR(OTP_CC_Error,
            "No secret given on the command line");

    return Status();
}

Status
parseUnsigned(uint64_t &result, const char *text)
{
    // strtoull would accept leading spaces and a sign, and wrap negatives:
    if (!isdigit(static_cast<unsigned char>(*text)))
        return OTP_ERROR(OTP_CC_Error,
            "Not a valid number: " + std::string(text));

    char *end = nullptr;
    errno = 0;
    unsigned long long value = strtoull(text, &end, 10);
    if (*end || ERANGE == errno)
        return OTP_ERROR(OTP_CC_Error,
            "Not a valid number: " + std::string(text));

    result = value;
    return Status();
}
