#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;
Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    const char* override_dir = std::getenv("PSM_CONFIG_DIR");
    if (override_dir && override_dir[0] != '\0') {
        return override_dir;
    }
    if (is_privileged()) {
        return "/etc/pisite-cpp";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/pisite-cpp";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::socket_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/pisite.sock";
}

std::string* Config::env_field(AppConfig& cfg, const std::string& var) {
    if (var == "PSM_PID_DIR") return &cfg.pid_dir;
    if (var == "PSM_USERNAME") return &cfg.auth_username;
    if (var == "PSM_PASSWORD") return &cfg.auth_password;
    if (var == "PSM_TOKEN") return &cfg.auth_token;
    return nullptr;
}

void Config::apply_env_overrides() {
    static const char* vars[] = {"PSM_PID_DIR", "PSM_USERNAME", "PSM_PASSWORD", "PSM_TOKEN"};
    for (const char* var : vars) {
        const char* v = std::getenv(var);
        if (!v || v[0] == '\0') continue;
        std::string* field = env_field(config_, var);
        // Remember the file value once so save() never persists the override
        if (file_values_.find(var) == file_values_.end()) {
            file_values_[var] = *field;
        }
        *field = v;
    }
}

void Config::restore_file_values(AppConfig& cfg) const {
    for (const auto& kv : file_values_) {
        *env_field(cfg, kv.first) = kv.second;
    }
}

bool Config::load() {
    restore_file_values(config_);
    file_values_.clear();

    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        apply_env_overrides();
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Supervisor section
        if (auto sup = root["supervisor"]) {
            config_.pid_dir = sup["pid_dir"].as<std::string>(config_.pid_dir);
            config_.watchdog_interval_ms = sup["watchdog_interval_ms"].as<int>(config_.watchdog_interval_ms);
            config_.watchdog_initial_delay_ms =
                sup["watchdog_initial_delay_ms"].as<int>(config_.watchdog_initial_delay_ms);
            config_.stop_grace_ms = sup["stop_grace_ms"].as<int>(config_.stop_grace_ms);
            config_.restart_delay_ms = sup["restart_delay_ms"].as<int>(config_.restart_delay_ms);
            config_.log_poll_interval_ms = sup["log_poll_interval_ms"].as<int>(config_.log_poll_interval_ms);
            config_.shell = sup["shell"].as<std::string>(config_.shell);
            config_.login_shell = sup["login_shell"].as<bool>(config_.login_shell);
            config_.session_tool = sup["session_tool"].as<std::string>(config_.session_tool);
            config_.session_socket = sup["session_socket"].as<std::string>(config_.session_socket);
            config_.force_backend = sup["force_backend"].as<std::string>(config_.force_backend);
        }

        // HTTP section
        if (auto http = root["http"]) {
            config_.http_enabled = http["enabled"].as<bool>(config_.http_enabled);
            config_.http_host = http["host"].as<std::string>(config_.http_host);
            config_.http_port = http["port"].as<int>(config_.http_port);
        }

        // Auth section
        if (auto auth = root["auth"]) {
            config_.auth_username = auth["username"].as<std::string>(config_.auth_username);
            config_.auth_password = auth["password"].as<std::string>(config_.auth_password);
            config_.auth_token = auth["token"].as<std::string>(config_.auth_token);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            config_.log_level = logging["level"].as<std::string>(config_.log_level);
            config_.log_file = logging["file"].as<std::string>(config_.log_file);
        }

        // Sites section
        config_.sites.clear();
        if (auto sites = root["sites"]) {
            for (const auto& node : sites) {
                SiteInfo site;
                site.name = node["name"].as<std::string>("");
                site.cwd = expand_home(node["cwd"].as<std::string>(""));
                site.cmd = node["cmd"].as<std::string>("");
                site.port = node["port"].as<int>(0);
                site.log = node["log"].as<std::string>("activity.log");
                if (site.log.empty()) site.log = "activity.log";
                site.autostart = node["autostart"].as<bool>(false);
                site.autorestart = node["autorestart"].as<bool>(false);
                if (site.name.empty()) continue;
                config_.sites.push_back(std::move(site));
            }
        }

        apply_env_overrides();
        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, use defaults
        apply_env_overrides();
        return false;
    }
}

bool Config::load_or_create() {
    std::string path = config_path();
    if (!path.empty() && !fs::exists(path)) {
        save();
    }
    return load();
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    AppConfig cfg = config_;
    restore_file_values(cfg);

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Supervisor section
        out << YAML::Key << "supervisor" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "pid_dir" << YAML::Value << cfg.pid_dir;
        out << YAML::Key << "watchdog_interval_ms" << YAML::Value << cfg.watchdog_interval_ms;
        out << YAML::Key << "watchdog_initial_delay_ms" << YAML::Value << cfg.watchdog_initial_delay_ms;
        out << YAML::Key << "stop_grace_ms" << YAML::Value << cfg.stop_grace_ms;
        out << YAML::Key << "restart_delay_ms" << YAML::Value << cfg.restart_delay_ms;
        out << YAML::Key << "log_poll_interval_ms" << YAML::Value << cfg.log_poll_interval_ms;
        out << YAML::Key << "shell" << YAML::Value << cfg.shell;
        out << YAML::Key << "login_shell" << YAML::Value << cfg.login_shell;
        out << YAML::Key << "session_tool" << YAML::Value << cfg.session_tool;
        out << YAML::Key << "session_socket" << YAML::Value << cfg.session_socket;
        out << YAML::Key << "force_backend" << YAML::Value << cfg.force_backend;
        out << YAML::EndMap;

        // HTTP section
        out << YAML::Key << "http" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << cfg.http_enabled;
        out << YAML::Key << "host" << YAML::Value << cfg.http_host;
        out << YAML::Key << "port" << YAML::Value << cfg.http_port;
        out << YAML::EndMap;

        // Auth section
        out << YAML::Key << "auth" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "username" << YAML::Value << cfg.auth_username;
        out << YAML::Key << "password" << YAML::Value << cfg.auth_password;
        out << YAML::Key << "token" << YAML::Value << cfg.auth_token;
        out << YAML::EndMap;

        // Logging section
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << cfg.log_level;
        out << YAML::Key << "file" << YAML::Value << cfg.log_file;
        out << YAML::EndMap;

        // Sites section
        out << YAML::Key << "sites" << YAML::Value << YAML::BeginSeq;
        for (const auto& site : cfg.sites) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << site.name;
            out << YAML::Key << "cwd" << YAML::Value << site.cwd;
            out << YAML::Key << "cmd" << YAML::Value << site.cmd;
            out << YAML::Key << "port" << YAML::Value << site.port;
            out << YAML::Key << "log" << YAML::Value << site.log;
            out << YAML::Key << "autostart" << YAML::Value << site.autostart;
            out << YAML::Key << "autorestart" << YAML::Value << site.autorestart;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::EndMap;

        std::string tmp_path = path + ".tmp";
        {
            std::ofstream fout(tmp_path, std::ios::trunc);
            if (!fout.is_open()) return false;
            fout << out.c_str() << "\n";
            fout.flush();
            if (!fout) return false;
        }

        // Keep the previous file; the rename below replaces it atomically
        if (fs::exists(path)) {
            fs::copy_file(path, path + ".bak", fs::copy_options::overwrite_existing);
        }
        fs::rename(tmp_path, path);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
