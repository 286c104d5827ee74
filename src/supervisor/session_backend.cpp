#include "supervisor/session_backend.hpp"
#include "core/shell.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

SessionBackend::SessionBackend(Options opts) : opts_(std::move(opts)) {
    stdbuf_path_ = Shell::find_executable("stdbuf");
}

SessionBackend::~SessionBackend() = default;

std::string SessionBackend::session_name(const std::string& site_name) {
    return site_name;
}

std::string SessionBackend::tool_prefix() const {
    std::string prefix = Shell::quote(opts_.tool);
    if (!opts_.socket.empty()) {
        prefix += " -L " + Shell::quote(opts_.socket);
    }
    return prefix;
}

std::string SessionBackend::exact_target(const std::string& name) {
    // '=' forces an exact match instead of a prefix match
    return Shell::quote("=" + session_name(name));
}

bool SessionBackend::has_session(const std::string& name) const {
    std::string cmd = tool_prefix() + " has-session -t " + exact_target(name) + " >/dev/null 2>&1";
    return Shell::run_command(cmd) == 0;
}

std::string SessionBackend::build_command(const Site& site) const {
    std::string inner = Shell::quote(opts_.shell) + " -c " + Shell::quote(site.cmd);
    if (!stdbuf_path_.empty()) {
        inner = Shell::quote(stdbuf_path_) + " -oL -eL " + inner;
    }

    // Output goes to the pane and is appended to the log at the same time
    std::string script = "export PYTHONUNBUFFERED=1; " + inner +
                         " 2>&1 | tee -a " + Shell::quote(site.log_path());

    return Shell::quote(opts_.shell) + (opts_.login_shell ? " -lc " : " -c ") + Shell::quote(script);
}

ActionResult SessionBackend::start(const Site& site) {
    std::error_code ec;
    if (site.cwd.empty() || !fs::is_directory(site.cwd, ec)) {
        return ActionResult::fail(SupervisorError::BackendError,
                                  "CWD does not exist: " + site.cwd);
    }

    if (has_session(site.name)) {
        return ActionResult::ok(site.name + " already running in " + opts_.tool);
    }

    std::string cmd = tool_prefix() + " new-session -d -s " + Shell::quote(session_name(site.name)) +
                      " -c " + Shell::quote(site.cwd) + " " + Shell::quote(build_command(site));
    int rc = 0;
    std::string output = Shell::run_command_output(cmd, &rc);
    if (rc != 0) {
        std::string cause = output.empty() ? "exit code " + std::to_string(rc) : output;
        spdlog::error("[Session] Failed to start {}: {}", site.name, cause);
        return ActionResult::fail(SupervisorError::BackendError,
                                  "Failed to start " + site.name + ": " + cause);
    }

    spdlog::info("[Session] Started {} in {}", site.name, opts_.tool);
    return ActionResult::ok("Started " + site.name + " in " + opts_.tool);
}

ActionResult SessionBackend::stop(const Site& site) {
    if (!has_session(site.name)) {
        return ActionResult::ok("Session " + site.name + " not running");
    }

    int rc = 0;
    std::string output = Shell::run_command_output(
        tool_prefix() + " kill-session -t " + exact_target(site.name), &rc);
    if (rc != 0 && has_session(site.name)) {
        std::string cause = output.empty() ? "exit code " + std::to_string(rc) : output;
        spdlog::error("[Session] Failed to stop {}: {}", site.name, cause);
        return ActionResult::fail(SupervisorError::BackendError,
                                  "Failed to stop " + site.name + ": " + cause);
    }

    spdlog::info("[Session] Stopped {}", site.name);
    return ActionResult::ok("Stopped " + site.name);
}

ProbeResult SessionBackend::status(const Site& site) {
    ProbeResult result;
    if (!has_session(site.name)) return result;

    result.state = RunState::Running;

    int rc = 0;
    std::string out = Shell::run_command_output(
        tool_prefix() + " list-panes -t " + exact_target(site.name) + " -F '#{pane_pid}'", &rc);
    if (rc == 0) {
        try {
            result.pid = std::stoi(out);
        } catch (const std::exception&) {
            result.pid = -1;
        }
    }
    return result;
}
