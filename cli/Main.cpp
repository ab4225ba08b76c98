/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "Command.hpp"
#include "Util.hpp"
#include "../otpcore/util/Debug.hpp"
#include <iostream>
#include <getopt.h>

using namespace otpcore;

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // Parse out the command-line options:
    std::string secret;
    std::string minValid;
    std::string logFile;
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"secret",      required_argument, nullptr, 's'},
        {"min-valid",   required_argument, nullptr, 'm'},
        {"log",         required_argument, nullptr, 'l'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "hl:m:s:", long_options, nullptr)))
    {
        switch (c)
        {
        case 'h':
            wantHelp = true;
            break;
        case 'l':
            logFile = optarg;
            break;
        case 'm':
            minValid = optarg;
            break;
        case 's':
            secret = optarg;
            break;
        case '?':
            if (optopt == 'l')
                return OTP_ERROR(OTP_CC_Error, "-l requires a log file");
            else if (optopt == 'm')
                return OTP_ERROR(OTP_CC_Error, "-m requires a number of seconds");
            else if (optopt == 's')
                return OTP_ERROR(OTP_CC_Error, "-s requires a secret");
            else
                return OTP_ERROR(OTP_CC_Error, "Unknown option " +
                                 std::string(argv[optind - 1]));
        default:
            return OTP_ERROR(OTP_CC_Error, "Cannot parse the options");
        }
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // Find the command:
    if (argc < 1)
    {
        Command::list(std::cout);
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    Command *command = Command::find(commandName);
    if (!command)
        return OTP_ERROR(OTP_CC_Error,
                         "unknown command " + std::string(commandName));

    if (wantHelp)
    {
        std::cout << command->usage() << std::endl;
        return Status();
    }

    DebugLogScope log;
    if (!logFile.empty())
        OTP_CHECK(log.open(logFile));

    Session session;
    session.secret = secret;
    if (!minValid.empty())
    {
        uint64_t value;
        OTP_CHECK(parseUnsigned(value, minValid.c_str()));
        // Out-of-range values are left for generateCode to reject:
        session.minValidSeconds = value <= TOTP_PERIOD ?
            static_cast<int>(value) : TOTP_PERIOD + 1;
    }

    return command->run(session, argc, argv);
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
