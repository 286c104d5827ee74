#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, -1 if no subcommand (caller should launch TUI),
    /// or -2 for the daemon subcommand.
    static int run(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status(int argc, char* argv[]);
    static int cmd_action(const std::string& op, int argc, char* argv[]);
    static int cmd_logs(int argc, char* argv[]);
    static int cmd_site(int argc, char* argv[]);
    static int cmd_reload();

    static int site_list();
    static int site_add(int argc, char* argv[]);
    static int site_rm(int argc, char* argv[]);
};
