/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */
/**
 * @file
 * Caller-controlled cancellation for blocking waits.
 */

#ifndef OTPCORE_UTIL_INTERRUPT_HPP
#define OTPCORE_UTIL_INTERRUPT_HPP

#include "Status.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace otpcore {

/**
 * A flag that one thread can raise to wake another thread
 * out of a timed sleep.
 * Once triggered, the interrupt stays raised until `reset` is called.
 */
class Interrupt
{
public:
    Interrupt();

    /**
     * Raises the flag and wakes every sleeping thread.
     * Safe to call from any thread, but not from a signal handler.
     */
    void
    trigger();

    bool
    triggered() const;

    /**
     * Lowers the flag so the object can be reused.
     */
    void
    reset();

    /**
     * Blocks for the given duration.
     * Returns OTP_CC_Interrupted if the flag is raised before
     * the time runs out, or was already raised on entry.
     */
    Status
    sleep(std::chrono::milliseconds duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool triggered_;
};

} // namespace otpcore

#endif
