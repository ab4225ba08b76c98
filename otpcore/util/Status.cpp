/*
 *  Copyright (c) 2026, otpcore developers.
 *  All rights reserved.
 */
#include "Status.hpp"

namespace otpcore {

const char *
statusCodeName(tOTP_CC value)
{
    switch (value)
    {
    case OTP_CC_Ok:
        return "Ok";
    case OTP_CC_Error:
        return "Error";
    case OTP_CC_InvalidSecret:
        return "InvalidSecret";
    case OTP_CC_InvalidConfiguration:
        return "InvalidConfiguration";
    case OTP_CC_Interrupted:
        return "Interrupted";
    case OTP_CC_SysError:
        return "SysError";
    }
    return "Unknown";
}

Status::Status() :
    value_(OTP_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tOTP_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() <<
        " " << statusCodeName(s.value()) << " (" << s.message() << ")";
    return output;
}

} // namespace otpcore
