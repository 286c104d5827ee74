#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/site_registry.hpp"
#include "daemon/ipc_client.hpp"
#include "supervisor/backend_selector.hpp"
#include "supervisor/supervisor.hpp"

#include <atomic>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <vector>
#include <signal.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// In-process supervisor used when no daemon is listening
struct LocalContext {
    Config config;
    std::unique_ptr<SiteRegistry> registry;
    std::unique_ptr<Supervisor> supervisor;
};

static std::unique_ptr<LocalContext> open_local() {
    auto ctx = std::make_unique<LocalContext>();
    ctx->config.load();
    const auto& d = ctx->config.data();

    Supervisor::Options opts;
    opts.restart_delay_ms = d.restart_delay_ms;
    opts.log_poll_interval_ms = d.log_poll_interval_ms;

    ctx->registry = std::make_unique<SiteRegistry>(ctx->config);
    ctx->supervisor = std::make_unique<Supervisor>(*ctx->registry, BackendSelector::select(d), opts);
    return ctx;
}

static std::atomic<bool> g_follow_stop{false};

static void follow_signal_handler(int /*sig*/) {
    g_follow_stop.store(true);
}

static int report(const ActionResult& result) {
    if (result.success) {
        if (!result.message.empty()) std::cout << result.message << "\n";
        return 0;
    }
    std::cerr << "Error: " << result.message << "\n";
    return 1;
}

static void print_status_table(const std::vector<SiteStatus>& all) {
    printf("%-18s %-8s %-11s %-8s %-6s %s\n", "NAME", "STATUS", "MODE", "PID", "PORT", "COMMAND");
    for (const auto& st : all) {
        std::string pid = st.pid > 0 ? std::to_string(st.pid) : "-";
        std::string port = st.port > 0 ? std::to_string(st.port) : "-";
        std::string cmd = st.cmd;
        if (cmd.size() > 48) cmd = cmd.substr(0, 45) + "...";
        printf("%-18s %-8s %-11s %-8s %-6s %s\n",
               st.name.c_str(),
               to_string(st.state),
               to_string(st.mode),
               pid.c_str(),
               port.c_str(),
               cmd.c_str());
    }
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → launch TUI

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status(argc, argv);
    }
    if (std::strcmp(cmd, "start") == 0 || std::strcmp(cmd, "stop") == 0 || std::strcmp(cmd, "restart") == 0) {
        return cmd_action(cmd, argc, argv);
    }
    if (std::strcmp(cmd, "logs") == 0) {
        return cmd_logs(argc, argv);
    }
    if (std::strcmp(cmd, "site") == 0) {
        return cmd_site(argc, argv);
    }
    if (std::strcmp(cmd, "reload") == 0) {
        return cmd_reload();
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'pisite-cpp help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "pisite-cpp: supervisor for long-running site processes\n"
        "\n"
        "Usage:\n"
        "  pisite-cpp                       Launch TUI (default)\n"
        "  pisite-cpp daemon                Run supervisor daemon (watchdog + HTTP API)\n"
        "  pisite-cpp status [name]         Show site status\n"
        "  pisite-cpp start <name>          Start a site\n"
        "  pisite-cpp stop <name>           Stop a site\n"
        "  pisite-cpp restart <name>        Restart a site\n"
        "  pisite-cpp logs <name> [-n N] [-f]\n"
        "                                   Print the last N log lines, -f to follow\n"
        "  pisite-cpp site list             List configured sites\n"
        "  pisite-cpp site add <name> <cwd> <cmd> [--log F] [--port P]\n"
        "                  [--autostart] [--autorestart] [--start]\n"
        "                                   Register a site\n"
        "  pisite-cpp site rm <name>        Stop and remove a site\n"
        "  pisite-cpp reload                Re-read the config file\n"
        "  pisite-cpp version               Show version\n"
        "  pisite-cpp help                  Show this help\n"
        "\n"
        "Commands go through the daemon when it is running and act\n"
        "directly otherwise.\n"
        "\n"
        "Keyboard shortcuts (TUI mode):\n"
        "  S / X / R   Start / stop / restart selected site\n"
        "  Enter, L    Open log panel\n"
        "  F / E       Freeze / export log (log panel)\n"
        "  Esc         Back\n"
        "  Q           Quit\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "pisite-cpp " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status(int argc, char* argv[]) {
    DaemonClient dc;
    bool daemon = dc.is_daemon_running();

    if (argc >= 3) {
        std::string name = argv[2];
        StatusResult result;
        if (daemon) {
            result = dc.site_status(name);
        } else {
            auto local = open_local();
            result = local->supervisor->status(name);
        }
        if (!result.success) {
            std::cerr << "Error: " << result.message << "\n";
            return 1;
        }
        const auto& st = result.status;
        std::cout << "Name:    " << st.name << "\n";
        std::cout << "Status:  " << to_string(st.state) << "\n";
        std::cout << "Mode:    " << to_string(st.mode) << "\n";
        if (st.pid > 0) std::cout << "PID:     " << st.pid << "\n";
        if (st.port > 0) std::cout << "Port:    " << st.port << "\n";
        std::cout << "CWD:     " << st.cwd << "\n";
        std::cout << "Command: " << st.cmd << "\n";
        std::cout << "Log:     " << st.log << "\n";
        return 0;
    }

    std::vector<SiteStatus> all;
    if (daemon) {
        auto ds = dc.get_status();
        std::cout << "Daemon:  running (pid " << ds.pid << ", " << ds.mode << " backend)\n";
        std::string err;
        all = dc.status_all(err);
        if (!err.empty()) {
            std::cerr << "Error: " << err << "\n";
            return 1;
        }
    } else {
        std::cout << "Daemon:  not running\n";
        auto local = open_local();
        all = local->supervisor->status_all();
    }

    if (all.empty()) {
        std::cout << "No sites configured.\n";
        return 0;
    }
    std::cout << "\n";
    print_status_table(all);
    return 0;
}

// ── start / stop / restart ──────────────────────────────────

int CLI::cmd_action(const std::string& op, int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: pisite-cpp " << op << " <name>\n";
        return 1;
    }
    std::string name = argv[2];

    DaemonClient dc;
    if (dc.is_daemon_running()) {
        if (op == "start") return report(dc.start(name));
        if (op == "stop") return report(dc.stop(name));
        return report(dc.restart(name));
    }

    auto local = open_local();
    if (op == "start") return report(local->supervisor->start(name));
    if (op == "stop") return report(local->supervisor->stop(name));
    return report(local->supervisor->restart(name));
}

// ── logs ────────────────────────────────────────────────────

int CLI::cmd_logs(int argc, char* argv[]) {
    std::string name;
    int lines = LogTailer::DEFAULT_LINES;
    bool follow = false;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "-f") == 0 || std::strcmp(argv[i], "--follow") == 0) {
            follow = true;
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            try {
                lines = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid line count: " << argv[i] << "\n";
                return 1;
            }
        } else if (name.empty()) {
            name = argv[i];
        } else {
            std::cerr << "Unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }
    if (name.empty()) {
        std::cerr << "Usage: pisite-cpp logs <name> [-n N] [-f]\n";
        return 1;
    }

    DaemonClient dc;
    bool daemon = dc.is_daemon_running();
    std::unique_ptr<LocalContext> local;
    if (!daemon) local = open_local();

    auto tailed = daemon ? dc.tail(name, lines) : local->supervisor->tail(name, lines);
    if (!tailed.success) {
        std::cerr << "Error: " << tailed.message << "\n";
        return 1;
    }
    for (const auto& line : tailed.lines) {
        std::cout << line << "\n";
    }
    if (!follow) return 0;

    std::cout.flush();
    g_follow_stop.store(false);
    struct sigaction sa;
    sa.sa_handler = follow_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto print = [](const std::string& line) {
        std::cout << line << std::endl;
    };
    auto result = daemon ? dc.watch(name, print, g_follow_stop)
                         : local->supervisor->watch(name, print, g_follow_stop);
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }
    return 0;
}

// ── site ────────────────────────────────────────────────────

int CLI::cmd_site(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: pisite-cpp site <list|add|rm>\n";
        return 1;
    }

    const char* sub = argv[2];
    if (std::strcmp(sub, "list") == 0) return site_list();
    if (std::strcmp(sub, "add") == 0) return site_add(argc, argv);
    if (std::strcmp(sub, "rm") == 0) return site_rm(argc, argv);

    std::cerr << "Unknown site command: " << sub << "\n";
    std::cerr << "Usage: pisite-cpp site <list|add|rm>\n";
    return 1;
}

int CLI::site_list() {
    DaemonClient dc;
    std::vector<Site> sites;
    if (dc.is_daemon_running()) {
        std::string err;
        sites = dc.list_sites(err);
        if (!err.empty()) {
            std::cerr << "Error: " << err << "\n";
            return 1;
        }
    } else {
        Config config;
        config.load();
        SiteRegistry registry(config);
        sites = registry.list();
    }

    if (sites.empty()) {
        std::cout << "No sites configured.\n";
        return 0;
    }

    printf("%-18s %-6s %-5s %-30s %s\n", "NAME", "PORT", "FLAGS", "CWD", "COMMAND");
    for (const auto& s : sites) {
        std::string port = s.port > 0 ? std::to_string(s.port) : "-";
        std::string flags;
        flags += s.autostart ? 'S' : '-';
        flags += s.autorestart ? 'R' : '-';
        printf("%-18s %-6s %-5s %-30s %s\n",
               s.name.c_str(), port.c_str(), flags.c_str(), s.cwd.c_str(), s.cmd.c_str());
    }
    return 0;
}

int CLI::site_add(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: pisite-cpp site add <name> <cwd> <cmd> [--log F] [--port P] "
                     "[--autostart] [--autorestart] [--start]\n";
        return 1;
    }

    Site site;
    site.name = argv[3];
    site.cwd = Config::expand_home(argv[4]);
    site.cmd = argv[5];
    bool start_after = false;

    for (int i = 6; i < argc; ++i) {
        if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            site.log = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            try {
                site.port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--autostart") == 0) {
            site.autostart = true;
        } else if (std::strcmp(argv[i], "--autorestart") == 0) {
            site.autorestart = true;
        } else if (std::strcmp(argv[i], "--start") == 0) {
            start_after = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    DaemonClient dc;
    if (dc.is_daemon_running()) {
        return report(dc.add_site(site, start_after));
    }
    auto local = open_local();
    return report(local->supervisor->add_site(site, start_after));
}

int CLI::site_rm(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: pisite-cpp site rm <name>\n";
        return 1;
    }
    std::string name = argv[3];

    DaemonClient dc;
    if (dc.is_daemon_running()) {
        return report(dc.delete_site(name));
    }
    auto local = open_local();
    return report(local->supervisor->remove_site(name));
}

// ── reload ──────────────────────────────────────────────────

int CLI::cmd_reload() {
    DaemonClient dc;
    if (dc.is_daemon_running()) {
        auto result = dc.reload();
        if (result.success) {
            std::cout << "Config reloaded.\n";
            return 0;
        }
        return report(result);
    }
    std::cout << "Daemon not running; the config file is read on each command.\n";
    return 0;
}
