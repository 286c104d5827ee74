#pragma once

#include "core/config.hpp"
#include "core/site_registry.hpp"
#include "supervisor/supervisor.hpp"
#include "supervisor/watchdog.hpp"
#include "api/http_server.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class Daemon {
public:
    explicit Daemon(Config& config);

    /// Use the given backend instead of probing for the session tool
    Daemon(Config& config, std::unique_ptr<Backend> backend);
    ~Daemon();

    /// Main loop, blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    Supervisor& supervisor() { return supervisor_; }
    Watchdog& watchdog() { return watchdog_; }

private:
    Config& config_;
    SiteRegistry registry_;
    Supervisor supervisor_;
    Watchdog watchdog_;
    std::unique_ptr<HttpServer> http_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;
    std::string socket_path_;

    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex connections_mutex_;
    std::list<Connection> connections_;

    // IPC
    bool start_ipc_server();
    void ipc_loop();
    void serve_client(int client_fd);
    void stream_logs(int client_fd, const std::string& name);
    std::string handle_command(const std::string& json_line);
    void reap_connections(bool wait_all);
    void cleanup_socket();

    static bool write_line(int fd, const std::string& line);
};
