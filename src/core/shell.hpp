#pragma once

#include <string>

class Shell {
public:
    /// Wrap s in single quotes, escaping embedded single quotes
    static std::string quote(const std::string& s);

    /// Run through /bin/sh; returns the exit status (-1 if it could not run)
    static int run_command(const std::string& cmd);

    /// Run through /bin/sh and capture stdout+stderr, trailing newlines trimmed
    static std::string run_command_output(const std::string& cmd, int* exit_code = nullptr);

    /// Resolve name against PATH; empty if not found or not executable
    static std::string find_executable(const std::string& name);
};
