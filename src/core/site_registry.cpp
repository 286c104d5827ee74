#include "core/site_registry.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <set>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

std::string Site::log_path() const {
    fs::path log_file(log.empty() ? "activity.log" : log);
    if (log_file.is_absolute()) return log_file.string();
    return (fs::path(cwd) / log_file).string();
}

Site Site::from_info(const SiteInfo& info) {
    Site site;
    site.name = info.name;
    site.cwd = info.cwd;
    site.cmd = info.cmd;
    site.port = info.port;
    site.log = info.log.empty() ? "activity.log" : info.log;
    site.autostart = info.autostart;
    site.autorestart = info.autorestart;
    return site;
}

SiteInfo Site::to_info() const {
    SiteInfo info;
    info.name = name;
    info.cwd = cwd;
    info.cmd = cmd;
    info.port = port;
    info.log = log;
    info.autostart = autostart;
    info.autorestart = autorestart;
    return info;
}

SiteRegistry::SiteRegistry(Config& config) : config_(config) {
    sync_from_config();
}

bool SiteRegistry::is_valid_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

void SiteRegistry::sync_from_config() {
    sites_.clear();
    std::set<std::string> seen;
    for (const auto& info : config_.data().sites) {
        if (!is_valid_name(info.name)) {
            spdlog::warn("[Registry] Skipping site with invalid name '{}'", info.name);
            continue;
        }
        if (!seen.insert(info.name).second) {
            spdlog::warn("[Registry] Skipping duplicate site '{}'", info.name);
            continue;
        }
        sites_.push_back(Site::from_info(info));
    }
    // Skipped entries leave the in-memory config too
    if (sites_.size() != config_.data().sites.size()) sync_to_config();
}

void SiteRegistry::sync_to_config() {
    config_.data().sites.clear();
    for (const auto& site : sites_) {
        config_.data().sites.push_back(site.to_info());
    }
}

std::vector<Site> SiteRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sites_;
}

std::optional<Site> SiteRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& site : sites_) {
        if (site.name == name) return site;
    }
    return std::nullopt;
}

bool SiteRegistry::contains(const std::string& name) const {
    return get(name).has_value();
}

SiteRegistry::RegistryResult SiteRegistry::add(const Site& site) {
    if (!is_valid_name(site.name)) {
        return {false, "Invalid name (letters, digits, '-' and '_' only)"};
    }
    std::error_code ec;
    if (site.cwd.empty() || !fs::is_directory(site.cwd, ec)) {
        return {false, "CWD does not exist: " + site.cwd};
    }
    if (site.cmd.empty()) {
        return {false, "Command cannot be empty"};
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& existing : sites_) {
        if (existing.name == site.name) {
            return {false, "A site with that name already exists"};
        }
    }

    Site copy = site;
    if (copy.log.empty()) copy.log = "activity.log";
    sites_.push_back(std::move(copy));
    sync_to_config();

    if (!config_.save()) {
        sites_.pop_back();
        sync_to_config();
        return {false, "Failed to save config file"};
    }
    return {true, ""};
}

bool SiteRegistry::remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(sites_.begin(), sites_.end(),
                           [&](const Site& s) { return s.name == name; });
    if (it == sites_.end()) return false;

    auto index = it - sites_.begin();
    Site removed = std::move(*it);
    sites_.erase(it);
    sync_to_config();

    if (!config_.save()) {
        sites_.insert(sites_.begin() + index, std::move(removed));
        sync_to_config();
        return false;
    }
    return true;
}

bool SiteRegistry::reload() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool ok = config_.load();
    sync_from_config();
    return ok;
}
