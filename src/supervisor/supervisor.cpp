#include "supervisor/supervisor.hpp"

#include <spdlog/spdlog.h>

Supervisor::Supervisor(SiteRegistry& registry, std::unique_ptr<Backend> backend, Options opts)
    : registry_(registry), backend_(std::move(backend)), opts_(opts) {}

Supervisor::~Supervisor() = default;

std::shared_ptr<std::mutex> Supervisor::site_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = site_locks_[name];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void Supervisor::forget_site_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = site_locks_.find(name);
    // Kept while another caller holds or waits on it
    if (it != site_locks_.end() && it->second.use_count() == 1) {
        site_locks_.erase(it);
    }
}

std::size_t Supervisor::lock_entries() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return site_locks_.size();
}

template <typename Fn>
bool Supervisor::with_site(const std::string& name, Fn&& fn) {
    if (!registry_.contains(name)) return false;

    auto guard = site_lock(name);
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(*guard);
        auto site = registry_.get(name);
        if (site) {
            found = true;
            fn(*site);
        }
    }
    guard.reset();
    if (!found) forget_site_lock(name);
    return found;
}

ActionResult Supervisor::not_found(const std::string& name) {
    return ActionResult::fail(SupervisorError::NotFound, "Site not found: " + name);
}

BackendMode Supervisor::mode() const {
    return backend_->mode();
}

SiteStatus Supervisor::probe(const Site& site) {
    auto probed = backend_->status(site);

    SiteStatus st;
    st.name = site.name;
    st.state = probed.state;
    st.mode = backend_->mode();
    st.pid = probed.pid;
    st.port = site.port;
    st.cwd = site.cwd;
    st.cmd = site.cmd;
    st.log = site.log_path();
    return st;
}

// ── Lifecycle ───────────────────────────────────────────────

ActionResult Supervisor::start(const std::string& name) {
    ActionResult result = not_found(name);
    with_site(name, [&](const Site& site) { result = backend_->start(site); });
    return result;
}

ActionResult Supervisor::stop(const std::string& name) {
    ActionResult result = not_found(name);
    with_site(name, [&](const Site& site) { result = backend_->stop(site); });
    return result;
}

ActionResult Supervisor::restart(const std::string& name) {
    ActionResult result = not_found(name);
    with_site(name, [&](const Site& site) {
        result = backend_->restart(site, opts_.restart_delay_ms);
    });
    return result;
}

StatusResult Supervisor::status(const std::string& name) {
    StatusResult result;
    bool found = with_site(name, [&](const Site& site) {
        result.success = true;
        result.status = probe(site);
    });
    if (!found) {
        result.error = SupervisorError::NotFound;
        result.message = "Site not found: " + name;
    }
    return result;
}

std::vector<SiteStatus> Supervisor::status_all() {
    std::vector<SiteStatus> all;
    for (const auto& listed : registry_.list()) {
        // Sites removed since the listing are skipped
        with_site(listed.name, [&](const Site& site) { all.push_back(probe(site)); });
    }
    return all;
}

// ── Logs ────────────────────────────────────────────────────

LinesResult Supervisor::tail(const std::string& name, int n) {
    LinesResult result;
    auto site = registry_.get(name);
    if (!site) {
        result.error = SupervisorError::NotFound;
        result.message = "Site not found: " + name;
        return result;
    }

    auto tailed = LogTailer::tail(site->log_path(), n);
    if (!tailed.success) {
        result.error = SupervisorError::IOError;
        result.message = tailed.error;
        return result;
    }
    result.success = true;
    result.lines = std::move(tailed.lines);
    return result;
}

std::optional<LogCursor> Supervisor::open_cursor(const std::string& name) {
    auto site = registry_.get(name);
    if (!site) return std::nullopt;
    return LogCursor(site->log_path());
}

ActionResult Supervisor::watch(const std::string& name,
                               const std::function<void(const std::string&)>& callback,
                               std::atomic<bool>& stop_flag) {
    auto site = registry_.get(name);
    if (!site) return not_found(name);

    // No site lock: viewers only read the log file
    auto watched = watch_log(site->log_path(), callback, stop_flag, opts_.log_poll_interval_ms);
    if (!watched.success) {
        spdlog::warn("[Supervisor] Log stream for {} ended: {}", name, watched.error);
        return ActionResult::fail(SupervisorError::IOError, watched.error);
    }
    return ActionResult::ok("Stream closed");
}

// ── Registry operations ─────────────────────────────────────

ActionResult Supervisor::add_site(const Site& site, bool start_after_add) {
    auto added = registry_.add(site);
    if (!added.success) {
        return ActionResult::fail(SupervisorError::BackendError, added.error);
    }
    spdlog::info("[Supervisor] Added site {}", site.name);

    if (!start_after_add) {
        return ActionResult::ok("Added site " + site.name);
    }
    auto started = start(site.name);
    if (!started.success) {
        return ActionResult::fail(started.error, "Added site " + site.name + " but " + started.message);
    }
    return ActionResult::ok("Added site " + site.name + " and started");
}

ActionResult Supervisor::remove_site(const std::string& name) {
    ActionResult result = not_found(name);
    bool found = with_site(name, [&](const Site& site) {
        result = backend_->stop(site);
        if (!result.success) return;

        if (!registry_.remove(name)) {
            result = ActionResult::fail(SupervisorError::BackendError,
                                        "Failed to save config after removing " + name);
            return;
        }
        spdlog::info("[Supervisor] Deleted site {}", name);
        result = ActionResult::ok("Deleted site " + name);
    });
    if (found && result.success) forget_site_lock(name);
    return result;
}
