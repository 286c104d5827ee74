#pragma once

#include "supervisor/backend.hpp"

#include <string>
#include <sys/types.h>

/// Runs each site as a detached process group and records the group id in
/// <pid_dir>/<name>.pid. The pid file is the only persisted state.
class BackgroundBackend : public Backend {
public:
    struct Options {
        std::string pid_dir = "/tmp/pisite_pids";
        std::string shell = "/bin/bash";
        bool login_shell = true;
        int stop_grace_ms = 5000;
    };

    explicit BackgroundBackend(Options opts);
    ~BackgroundBackend() override;

    ActionResult start(const Site& site) override;
    ActionResult stop(const Site& site) override;
    ProbeResult status(const Site& site) override;
    BackendMode mode() const override { return BackendMode::Background; }

    /// Path of the pid file for a site name
    std::string pid_file(const std::string& name) const;

    /// Recorded process group id, or -1 if the file is missing or invalid
    pid_t read_pid(const std::string& name) const;

    /// True if any member of the process group is still alive
    static bool group_alive(pid_t pgid);

private:
    Options opts_;
    std::string stdbuf_path_;
    std::string shell_path_;

    bool write_pid(const std::string& name, pid_t pid, std::string& err) const;
    void remove_pid(const std::string& name) const;
    bool wait_for_exit(pid_t pgid, int timeout_ms) const;
    pid_t spawn(const Site& site, std::string& err) const;

    static void reap(pid_t pid);
};
