#include "daemon/daemon.hpp"
#include "daemon/protocol.hpp"
#include "supervisor/backend_selector.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <chrono>

namespace fs = std::filesystem;
using json = nlohmann::json;

static Supervisor::Options supervisor_options(const AppConfig& cfg) {
    Supervisor::Options opts;
    opts.restart_delay_ms = cfg.restart_delay_ms;
    opts.log_poll_interval_ms = cfg.log_poll_interval_ms;
    return opts;
}

static Watchdog::Options watchdog_options(const AppConfig& cfg) {
    Watchdog::Options opts;
    opts.interval_ms = cfg.watchdog_interval_ms;
    opts.initial_delay_ms = cfg.watchdog_initial_delay_ms;
    return opts;
}

Daemon::Daemon(Config& config)
    : Daemon(config, BackendSelector::select(config.data())) {}

Daemon::Daemon(Config& config, std::unique_ptr<Backend> backend)
    : config_(config),
      registry_(config),
      supervisor_(registry_, std::move(backend), supervisor_options(config.data())),
      watchdog_(supervisor_, watchdog_options(config.data())),
      socket_path_(Config::socket_path()) {}

Daemon::~Daemon() {
    request_stop();
    watchdog_.stop();
    if (http_) http_->stop();
    reap_connections(true);
    cleanup_socket();
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        if (!socket_path_.empty()) {
            unlink(socket_path_.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    if (socket_path_.empty()) {
        spdlog::error("[Daemon] No config directory for the IPC socket");
        return false;
    }

    // Clean up any existing socket
    unlink(socket_path_.c_str());

    std::error_code ec;
    fs::create_directories(fs::path(socket_path_).parent_path(), ec);
    if (ec) {
        spdlog::error("[Daemon] Cannot create {}: {}", fs::path(socket_path_).parent_path().string(), ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) return false;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("[Daemon] Cannot bind {}: {}", socket_path_, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(socket_path_.c_str(), 0600);

    if (listen(socket_fd_, 16) < 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(socket_path_.c_str());
        return false;
    }

    spdlog::info("[Daemon] IPC listening on {}", socket_path_);
    return true;
}

bool Daemon::write_line(int fd, const std::string& line) {
    std::string msg = line + "\n";
    size_t total = 0;
    while (total < msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

void Daemon::reap_connections(bool wait_all) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        int ret = poll(&pfd, 1, 500); // 500ms timeout
        reap_connections(false);
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            // Don't let a silent client hold its thread forever
            struct timeval tv;
            tv.tv_sec = 5;
            tv.tv_usec = 0;
            setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.push_back({std::thread([this, client_fd, done]() {
                serve_client(client_fd);
                close(client_fd);
                done->store(true);
            }), done});
        }
    }
}

void Daemon::serve_client(int client_fd) {
    // Read a single JSON line
    std::string buffer;
    char c;
    while (read(client_fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) return; // prevent abuse
    }
    if (buffer.empty()) return;

    // watch keeps the connection open and streams
    json req = json::parse(buffer, nullptr, false);
    if (!req.is_discarded() && req.is_object() && req.value("cmd", "") == "watch") {
        stream_logs(client_fd, req.value("name", ""));
        return;
    }

    if (!write_line(client_fd, handle_command(buffer))) {
        spdlog::debug("[Daemon] Client went away before the response was written");
    }
}

void Daemon::stream_logs(int client_fd, const std::string& name) {
    auto cursor = supervisor_.open_cursor(name);
    if (!cursor) {
        write_line(client_fd, Protocol::error_response(SupervisorError::NotFound,
                                                       "Site not found: " + name).dump());
        return;
    }
    if (!write_line(client_fd, Protocol::ok_response().dump())) return;

    int interval = supervisor_.options().log_poll_interval_ms > 0 ? supervisor_.options().log_poll_interval_ms : 100;
    struct pollfd pfd;
    pfd.fd = client_fd;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        auto polled = cursor->poll();
        if (!polled.success) {
            spdlog::warn("[Daemon] Log stream for {} ended: {}", name, polled.error);
            write_line(client_fd, Protocol::error_response(SupervisorError::IOError, polled.error).dump());
            return;
        }
        for (const auto& line : polled.lines) {
            if (!write_line(client_fd, json({{"line", line}}).dump())) return;
        }

        // Readable here means the client closed its end (or sent garbage)
        int ret = poll(&pfd, 1, interval);
        if (ret > 0) {
            char peek;
            ssize_t n = recv(client_fd, &peek, 1, MSG_DONTWAIT);
            if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) return;
        }
    }
}

std::string Daemon::handle_command(const std::string& json_line) {
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");
        std::string name = req.value("name", "");

        if (cmd == "status") {
            if (name.empty()) {
                json data;
                data["mode"] = to_string(supervisor_.mode());
                data["sites"] = registry_.list().size();
                data["pid"] = static_cast<int>(getpid());
                return Protocol::ok_response(data).dump();
            }
            auto result = supervisor_.status(name);
            if (!result.success) return Protocol::error_response(result.error, result.message).dump();
            return Protocol::ok_response(Protocol::status_to_json(result.status)).dump();
        }

        if (cmd == "status_all") {
            json arr = json::array();
            for (const auto& st : supervisor_.status_all()) {
                arr.push_back(Protocol::status_to_json(st));
            }
            return Protocol::ok_response(arr).dump();
        }

        if (cmd == "start") {
            return Protocol::action_response(supervisor_.start(name)).dump();
        }

        if (cmd == "stop") {
            return Protocol::action_response(supervisor_.stop(name)).dump();
        }

        if (cmd == "restart") {
            return Protocol::action_response(supervisor_.restart(name)).dump();
        }

        if (cmd == "tail") {
            auto result = supervisor_.tail(name, req.value("lines", LogTailer::DEFAULT_LINES));
            if (!result.success) return Protocol::error_response(result.error, result.message).dump();
            return Protocol::ok_response(result.lines).dump();
        }

        if (cmd == "site_list") {
            json arr = json::array();
            for (const auto& site : registry_.list()) {
                arr.push_back(Protocol::site_to_json(site));
            }
            return Protocol::ok_response(arr).dump();
        }

        if (cmd == "site_add") {
            Site site = Protocol::site_from_json(req.value("site", json::object()));
            return Protocol::action_response(
                supervisor_.add_site(site, req.value("start", false))).dump();
        }

        if (cmd == "site_delete") {
            return Protocol::action_response(supervisor_.remove_site(name)).dump();
        }

        if (cmd == "reload") {
            if (registry_.reload()) {
                spdlog::info("[Daemon] Config reloaded ({} sites)", registry_.list().size());
                return Protocol::ok_response().dump();
            }
            return json({{"ok", false}, {"error", "Failed to reload config"}}).dump();
        }

        return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();

    } catch (const std::exception& e) {
        return json({{"ok", false}, {"error", std::string("Parse error: ") + e.what()}}).dump();
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    // 1. Start IPC server
    if (!start_ipc_server()) {
        return 1;
    }

    // 2. Autostart pass, then the watchdog
    int started = watchdog_.autostart();
    spdlog::info("[Daemon] Autostarted {} site(s), backend {}", started, to_string(supervisor_.mode()));
    watchdog_.start();

    // 3. HTTP API
    const auto& cfg = config_.data();
    if (cfg.http_enabled) {
        HttpServer::Options opts;
        opts.host = cfg.http_host;
        opts.port = cfg.http_port;
        opts.username = cfg.auth_username;
        opts.password = cfg.auth_password;
        opts.token = cfg.auth_token;
        http_ = std::make_unique<HttpServer>(supervisor_, opts);
        if (!http_->start()) {
            spdlog::warn("[Daemon] HTTP API disabled, continuing with IPC only");
            http_.reset();
        }
    }

    // 4. IPC main loop
    ipc_loop();

    // 5. Cleanup; supervised sites keep running
    spdlog::info("[Daemon] Shutting down");
    stop_flag_.store(true);
    watchdog_.stop();
    if (http_) http_->stop();
    reap_connections(true);
    cleanup_socket();

    return 0;
}
