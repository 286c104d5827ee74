#pragma once

#include "core/site_registry.hpp"
#include "supervisor/backend.hpp"
#include "supervisor/log_tailer.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SiteStatus {
    std::string name;
    RunState state = RunState::Stopped;
    BackendMode mode = BackendMode::Background;
    int pid = -1;
    int port = 0;
    std::string cwd;
    std::string cmd;
    std::string log;

    bool running() const { return state == RunState::Running; }
};

struct StatusResult {
    bool success = false;
    SupervisorError error = SupervisorError::None;
    std::string message;
    SiteStatus status;
};

struct LinesResult {
    bool success = false;
    SupervisorError error = SupervisorError::None;
    std::string message;
    std::vector<std::string> lines;
};

/// Command surface used by the CLI, daemon IPC, HTTP API, TUI and
/// watchdog. Every backend call for a site runs under that site's lock.
class Supervisor {
public:
    struct Options {
        int restart_delay_ms = 300;
        int log_poll_interval_ms = 100;
    };

    Supervisor(SiteRegistry& registry, std::unique_ptr<Backend> backend, Options opts);
    ~Supervisor();

    ActionResult start(const std::string& name);
    ActionResult stop(const std::string& name);
    ActionResult restart(const std::string& name);
    StatusResult status(const std::string& name);
    std::vector<SiteStatus> status_all();

    LinesResult tail(const std::string& name, int n = LogTailer::DEFAULT_LINES);

    /// A fresh cursor positioned at the current end of the site's log;
    /// nullopt for an unknown site
    std::optional<LogCursor> open_cursor(const std::string& name);

    /// Blocks streaming appended log lines until stop_flag is set or the
    /// log becomes unreadable (IOError). Fails fast with NotFound.
    ActionResult watch(const std::string& name,
                       const std::function<void(const std::string&)>& callback,
                       std::atomic<bool>& stop_flag);

    /// Register a site; optionally start it right away
    ActionResult add_site(const Site& site, bool start_after_add);

    /// Stop a site and remove it from the registry. Both steps run under
    /// the site lock, so a queued start finds the site gone.
    ActionResult remove_site(const std::string& name);

    BackendMode mode() const;
    SiteRegistry& registry() { return registry_; }
    const Options& options() const { return opts_; }

    /// Number of per-site locks currently tracked
    std::size_t lock_entries() const;

private:
    SiteRegistry& registry_;
    std::unique_ptr<Backend> backend_;
    Options opts_;

    mutable std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> site_locks_;

    std::shared_ptr<std::mutex> site_lock(const std::string& name);
    void forget_site_lock(const std::string& name);

    /// Runs fn under the site lock with the entry re-read after locking;
    /// false when the site is unknown or was removed while waiting
    template <typename Fn>
    bool with_site(const std::string& name, Fn&& fn);

    SiteStatus probe(const Site& site);
    static ActionResult not_found(const std::string& name);
};
