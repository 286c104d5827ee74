#pragma once

#include <map>
#include <string>
#include <vector>

struct SiteInfo {
    std::string name;
    std::string cwd;
    std::string cmd;
    int port = 0;                       // display only, 0 = unset
    std::string log = "activity.log";   // relative to cwd
    bool autostart = false;
    bool autorestart = false;
};

struct AppConfig {
    // Supervisor
    std::string pid_dir = "/tmp/pisite_pids";
    int watchdog_interval_ms = 3000;
    int watchdog_initial_delay_ms = 1000;
    int stop_grace_ms = 5000;
    int restart_delay_ms = 300;
    int log_poll_interval_ms = 100;
    std::string shell = "/bin/bash";
    bool login_shell = true;
    std::string session_tool = "tmux";
    std::string session_socket;         // empty = tool default socket
    std::string force_backend;          // "", "session" or "background"

    // HTTP API
    bool http_enabled = true;
    std::string http_host = "127.0.0.1";
    int http_port = 8000;

    // Auth
    std::string auth_username = "admin";
    std::string auth_password = "password";
    std::string auth_token;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Sites
    std::vector<SiteInfo> sites;
};

class Config {
public:
    Config();
    ~Config();

    /// Load config.yaml; keeps defaults and returns false if missing or malformed
    bool load();

    /// Load, writing the default file first if none exists
    bool load_or_create();

    /// Atomic save: write tmp, keep previous file as .bak, rename into place
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    /// Apply PSM_* environment overrides on top of the loaded values
    void apply_env_overrides();

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string socket_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
    std::map<std::string, std::string> file_values_;   // env var -> value before override

    static std::string* env_field(AppConfig& cfg, const std::string& var);
    void restore_file_values(AppConfig& cfg) const;
};
