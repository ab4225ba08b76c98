/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "Command.hpp"
#include <iostream>
#include <map>

typedef std::map<std::string, Command *> CommandTable;

// Commands register from static constructors in other files,
// so the table has to exist before the first of them runs:
static CommandTable &
commandTable()
{
    static CommandTable table;
    return table;
}

Command::Command(const char *name, const char *args):
    name_(name),
    args_(args)
{
    auto &table = commandTable();
    if (!table.insert(CommandTable::value_type(name, this)).second)
        std::cerr << "warning: " << name << " is defined twice" << std::endl;
}

std::string
Command::usage() const
{
    std::string out = std::string("usage: otpcore-cli [options] ") + name_;
    if (*args_)
        out += std::string(" ") + args_;
    return out;
}

Command *
Command::find(const std::string &name)
{
    auto &table = commandTable();
    auto i = table.find(name);
    return table.end() == i ? nullptr : i->second;
}

void
Command::list(std::ostream &out)
{
    out << "commands:" << std::endl;
    for (const auto &i: commandTable())
        out << "  " << i.first << " " << i.second->args_ << std::endl;
}
