#pragma once

#include "core/site_registry.hpp"

#include <string>

enum class SupervisorError {
    None,
    NotFound,       // unknown site name
    BackendError,   // spawn / signal / session tool failure
    IOError,        // log file unreadable
};

enum class BackendMode { Session, Background };

enum class RunState { Stopped, Running };

const char* to_string(SupervisorError error);
const char* to_string(BackendMode mode);
const char* to_string(RunState state);

struct ActionResult {
    bool success = false;
    SupervisorError error = SupervisorError::None;
    std::string message;

    static ActionResult ok(std::string msg) {
        return {true, SupervisorError::None, std::move(msg)};
    }
    static ActionResult fail(SupervisorError err, std::string msg) {
        return {false, err, std::move(msg)};
    }
};

struct ProbeResult {
    RunState state = RunState::Stopped;
    int pid = -1;   // process group id (background) or pane pid (session), -1 when stopped
};

/// Process lifecycle backend. One implementation is chosen at startup and
/// used for every site; callers serialize calls per site.
class Backend {
public:
    virtual ~Backend() = default;

    /// No-op if the site is already running
    virtual ActionResult start(const Site& site) = 0;

    /// Succeeds if the site is already stopped
    virtual ActionResult stop(const Site& site) = 0;

    /// stop, wait settle_ms, then start; not atomic
    virtual ActionResult restart(const Site& site, int settle_ms);

    /// Always probes the live system
    virtual ProbeResult status(const Site& site) = 0;

    virtual BackendMode mode() const = 0;
};
