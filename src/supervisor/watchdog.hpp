#pragma once

#include "supervisor/supervisor.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/// Keeps autorestart sites running. Each cycle probes every flagged site
/// through the Supervisor (so it takes the same per-site lock as API
/// actions) and starts the ones found stopped.
class Watchdog {
public:
    struct Options {
        int interval_ms = 3000;
        int initial_delay_ms = 1000;
    };

    Watchdog(Supervisor& supervisor, Options opts);
    ~Watchdog();

    /// Start each autostart site once. Returns the number started.
    int autostart();

    /// One reconciliation pass. Returns the number of sites restarted.
    int cycle();

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    /// Last recorded failure per site (cleared on a successful start)
    std::map<std::string, std::string> failures() const;

private:
    Supervisor& supervisor_;
    Options opts_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex failures_mutex_;
    std::map<std::string, std::string> failures_;

    void loop();
    bool sleep_for(int ms);
    void record(const std::string& name, const ActionResult& result);
};
