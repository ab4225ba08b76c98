/*
 *  Copyright (c) 2026, otpcore developers.
 *  All rights reserved.
 */
#ifndef OTPCORE_UTIL_STATUS_HPP
#define OTPCORE_UTIL_STATUS_HPP

#include <stddef.h>
#include <ostream>
#include <string>

namespace otpcore {

/**
 * Result codes shared by all core functions.
 */
typedef enum eOTP_CC
{
    /** Success */
    OTP_CC_Ok = 0,
    /** Generic failure */
    OTP_CC_Error = 1,
    /** The secret contains a character outside the base32 alphabet */
    OTP_CC_InvalidSecret = 2,
    /** A tuning parameter lies outside its allowed range */
    OTP_CC_InvalidConfiguration = 3,
    /** A blocking wait was cancelled by the caller */
    OTP_CC_Interrupted = 4,
    /** A system call failed */
    OTP_CC_SysError = 5
} tOTP_CC;

/**
 * Returns the symbolic name of a result code.
 */
const char *
statusCodeName(tOTP_CC value);

/**
 * The outcome of an otpcore call.
 * Failures remember where they were raised.
 */
class Status
{
public:
    Status();
    Status(tOTP_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tOTP_CC value()             const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    // True on success:
    explicit operator bool() const { return value_ == OTP_CC_Ok; }

private:
    tOTP_CC value_;
    std::string message_;
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Builds a failure tagged with the caller's location.
 */
#define OTP_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Passes a failure up to the caller.
 */
#define OTP_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace otpcore

#endif
