/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "Interrupt.hpp"

namespace otpcore {

Interrupt::Interrupt():
    triggered_(false)
{
}

void
Interrupt::trigger()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cond_.notify_all();
}

bool
Interrupt::triggered() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
}

void
Interrupt::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    triggered_ = false;
}

Status
Interrupt::sleep(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (cond_.wait_for(lock, duration, [this]{ return triggered_; }))
        return OTP_ERROR(OTP_CC_Interrupted, "Wait interrupted");

    return Status();
}

} // namespace otpcore
