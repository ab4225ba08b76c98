/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../otpcore/Totp.hpp"
#include <ostream>
#include <string>

/**
 * Values collected from the command-line options,
 * shared with whichever command runs.
 */
struct Session
{
    std::string secret;
    int minValidSeconds = TOTP_DEFAULT_MIN_VALID;
};

/**
 * A sub-command of otpcore-cli.
 * Every instance adds itself to a table keyed by name.
 */
class Command
{
public:
    Command(const char *name, const char *args);
    virtual ~Command() {}

    virtual otpcore::Status
    run(Session &session, int argc, char *argv[]) = 0;

    const char *name() const { return name_; }

    /**
     * One line describing the arguments, for errors and --help.
     */
    std::string
    usage() const;

    /**
     * Looks a command up by name, or returns nullptr.
     */
    static Command *
    find(const std::string &name);

    static void
    list(std::ostream &out);

private:
    const char *name_;
    const char *args_;
};

/**
 * Declares a command and its single instance.
 * The function body follows in curly braces.
 */
#define COMMAND(NAME, TEXT, ARGS) \
    struct NAME: public Command { \
        NAME(): Command(TEXT, ARGS) {} \
        otpcore::Status run(Session &session, int argc, char *argv[]) override; \
    } instance##NAME; \
    otpcore::Status NAME::run(Session &session, int argc, char *argv[])

#endif
