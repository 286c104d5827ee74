#include "supervisor/watchdog.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

Watchdog::Watchdog(Supervisor& supervisor, Options opts)
    : supervisor_(supervisor), opts_(opts) {}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::record(const std::string& name, const ActionResult& result) {
    std::lock_guard<std::mutex> lock(failures_mutex_);
    if (result.success) {
        failures_.erase(name);
        return;
    }
    failures_[name] = result.message;
    spdlog::error("[Watchdog] Failed to start {}: {}", name, result.message);
}

std::map<std::string, std::string> Watchdog::failures() const {
    std::lock_guard<std::mutex> lock(failures_mutex_);
    return failures_;
}

int Watchdog::autostart() {
    int started = 0;
    for (const auto& site : supervisor_.registry().list()) {
        if (!site.autostart) continue;

        auto st = supervisor_.status(site.name);
        if (st.success && st.status.running()) continue;

        spdlog::info("[Watchdog] Autostarting {}", site.name);
        auto result = supervisor_.start(site.name);
        record(site.name, result);
        if (result.success) started++;
    }
    return started;
}

int Watchdog::cycle() {
    int restarted = 0;
    for (const auto& site : supervisor_.registry().list()) {
        if (!site.autorestart) continue;

        auto st = supervisor_.status(site.name);
        // Deleted between list() and status()
        if (!st.success || st.status.running()) continue;

        spdlog::info("[Watchdog] Restarting {}", site.name);
        auto result = supervisor_.start(site.name);
        record(site.name, result);
        if (result.success) restarted++;
    }
    return restarted;
}

bool Watchdog::start() {
    if (running_.load()) return true;
    running_.store(true);
    thread_ = std::thread(&Watchdog::loop, this);
    spdlog::info("[Watchdog] Monitoring every {} ms", opts_.interval_ms);
    return true;
}

void Watchdog::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

// Returns false when stop was requested during the wait
bool Watchdog::sleep_for(int ms) {
    for (int slept = 0; slept < ms && running_.load(); slept += 100) {
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(100, ms - slept)));
    }
    return running_.load();
}

void Watchdog::loop() {
    if (!sleep_for(opts_.initial_delay_ms)) return;

    while (running_.load()) {
        cycle();
        if (!sleep_for(opts_.interval_ms > 0 ? opts_.interval_ms : 3000)) break;
    }
}
