#pragma once

#include "core/config.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

/// Site descriptor as seen by the supervisor. Never mutated by it.
struct Site {
    std::string name;
    std::string cwd;
    std::string cmd;
    int port = 0;
    std::string log = "activity.log";
    bool autostart = false;
    bool autorestart = false;

    /// Absolute path of the log file (cwd / log, or log itself if absolute)
    std::string log_path() const;

    static Site from_info(const SiteInfo& info);
    SiteInfo to_info() const;
};

class SiteRegistry {
public:
    explicit SiteRegistry(Config& config);

    std::vector<Site> list() const;
    std::optional<Site> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    struct RegistryResult { bool success; std::string error; };
    /// Validate and append a site, then persist the config file. Nothing
    /// changes when the save fails.
    RegistryResult add(const Site& site);

    /// Remove a site and persist; false if it does not exist or the file
    /// could not be written, in which case the site is kept
    bool remove(const std::string& name);

    /// Re-read the config file and replace the site list. Entries with an
    /// invalid or repeated name are skipped with a warning.
    bool reload();

    /// Names must match [A-Za-z0-9_-]+
    static bool is_valid_name(const std::string& name);

private:
    Config& config_;
    mutable std::shared_mutex mutex_;
    std::vector<Site> sites_;

    void sync_from_config();
    void sync_to_config();
};
