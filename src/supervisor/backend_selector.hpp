#pragma once

#include "core/config.hpp"
#include "supervisor/backend.hpp"

#include <memory>
#include <string>

class BackendSelector {
public:
    /// Probe once for the session tool ("<tool> -V")
    static bool session_tool_available(const std::string& tool);

    /// Pick the session backend when the tool is installed, else the
    /// background backend. force_backend in the config overrides the probe.
    /// Logs the choice; never fails.
    static std::unique_ptr<Backend> select(const AppConfig& cfg);
};
