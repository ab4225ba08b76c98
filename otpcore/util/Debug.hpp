/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#ifndef OTPCORE_UTIL_DEBUG_HPP
#define OTPCORE_UTIL_DEBUG_HPP

#include "Status.hpp"
#include <string>

#define DEBUG_LEVEL 1

#define OTP_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        OTP_DebugLog(__VA_ARGS__);  \
    }                               \
}

namespace otpcore {

/**
 * Starts copying log messages into the given file.
 * An existing log is moved aside to `path + ".prev"`.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

/**
 * True while a log file is receiving messages.
 */
bool
debugLogOpen();

/**
 * Opens the log file and closes it again when the scope ends,
 * however the scope is left.
 */
class DebugLogScope
{
public:
    ~DebugLogScope() { debugTerminate(); }

    Status
    open(const std::string &path) { return debugInitialize(path); }
};

void OTP_DebugLog(const char *format, ...);

} // namespace otpcore

#endif
