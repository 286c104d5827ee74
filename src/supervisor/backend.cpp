#include "supervisor/backend.hpp"

#include <chrono>
#include <thread>

const char* to_string(SupervisorError error) {
    switch (error) {
        case SupervisorError::None: return "none";
        case SupervisorError::NotFound: return "not_found";
        case SupervisorError::BackendError: return "backend";
        case SupervisorError::IOError: return "io";
    }
    return "unknown";
}

const char* to_string(BackendMode mode) {
    return mode == BackendMode::Session ? "session" : "background";
}

const char* to_string(RunState state) {
    return state == RunState::Running ? "running" : "stopped";
}

ActionResult Backend::restart(const Site& site, int settle_ms) {
    auto stopped = stop(site);
    if (!stopped.success) return stopped;
    if (settle_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(settle_ms));
    }
    return start(site);
}
