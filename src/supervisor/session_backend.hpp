#pragma once

#include "supervisor/backend.hpp"

#include <string>

/// Runs each site inside a detached terminal multiplexer session named
/// after the site, so it can be attached to interactively.
class SessionBackend : public Backend {
public:
    struct Options {
        std::string tool = "tmux";
        std::string socket;     // -L socket name, empty = default server
        std::string shell = "/bin/bash";
        bool login_shell = true;
    };

    explicit SessionBackend(Options opts);
    ~SessionBackend() override;

    ActionResult start(const Site& site) override;
    ActionResult stop(const Site& site) override;
    ProbeResult status(const Site& site) override;
    BackendMode mode() const override { return BackendMode::Session; }

    /// Session name for a site (the site name itself)
    static std::string session_name(const std::string& site_name);

    bool has_session(const std::string& name) const;

    /// Shell line that runs the site command with output appended to its log
    std::string build_command(const Site& site) const;

private:
    Options opts_;
    std::string stdbuf_path_;

    std::string tool_prefix() const;
    static std::string exact_target(const std::string& name);
};
