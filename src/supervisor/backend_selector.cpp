#include "supervisor/backend_selector.hpp"
#include "supervisor/background_backend.hpp"
#include "supervisor/session_backend.hpp"
#include "core/shell.hpp"

#include <spdlog/spdlog.h>

bool BackendSelector::session_tool_available(const std::string& tool) {
    if (tool.empty()) return false;
    return Shell::run_command(Shell::quote(tool) + " -V >/dev/null 2>&1") == 0;
}

std::unique_ptr<Backend> BackendSelector::select(const AppConfig& cfg) {
    bool use_session = false;
    if (cfg.force_backend == "session") {
        use_session = true;
    } else if (cfg.force_backend == "background") {
        use_session = false;
    } else {
        if (!cfg.force_backend.empty()) {
            spdlog::warn("[Backend] Unknown force_backend '{}', probing instead", cfg.force_backend);
        }
        use_session = session_tool_available(cfg.session_tool);
    }

    if (use_session) {
        SessionBackend::Options opts;
        opts.tool = cfg.session_tool;
        opts.socket = cfg.session_socket;
        opts.shell = cfg.shell;
        opts.login_shell = cfg.login_shell;
        spdlog::info("[Backend] Using session backend ({})", cfg.session_tool);
        return std::make_unique<SessionBackend>(std::move(opts));
    }

    BackgroundBackend::Options opts;
    opts.pid_dir = Config::expand_home(cfg.pid_dir);
    opts.shell = cfg.shell;
    opts.login_shell = cfg.login_shell;
    opts.stop_grace_ms = cfg.stop_grace_ms;
    if (cfg.force_backend == "background") {
        spdlog::info("[Backend] Using background backend (pid dir {})", opts.pid_dir);
    } else {
        spdlog::info("[Backend] {} not available, using background backend (pid dir {})",
                     cfg.session_tool, opts.pid_dir);
    }
    return std::make_unique<BackgroundBackend>(std::move(opts));
}
