#include "daemon/ipc_client.hpp"
#include "daemon/protocol.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

using json = nlohmann::json;

static const char* NO_DAEMON = "Cannot connect to daemon";

DaemonClient::DaemonClient() : socket_path_(Config::socket_path()) {}

DaemonClient::DaemonClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}

int DaemonClient::connect_socket() const {
    if (socket_path_.empty() || access(socket_path_.c_str(), F_OK) != 0) return -1;

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

static bool send_line(int fd, const std::string& msg) {
    size_t total = 0;
    while (total < msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

// Reads one '\n'-terminated line; false on EOF, timeout or error
static bool read_line(int fd, std::string& out) {
    out.clear();
    char c;
    while (true) {
        ssize_t n = read(fd, &c, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n != 1) return false;
        if (c == '\n') return true;
        out += c;
        if (out.size() > (1 << 20)) return false;
    }
}

json DaemonClient::send_command(const json& cmd) {
    int fd = connect_socket();
    if (fd < 0) return json();

    // Set read timeout; restart waits for stop grace + restart delay
    struct timeval tv;
    tv.tv_sec = 30;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    if (!send_line(fd, cmd.dump() + "\n")) {
        close(fd);
        return json();
    }

    std::string buffer;
    bool got = read_line(fd, buffer);
    close(fd);
    if (!got || buffer.empty()) return json();

    json resp = json::parse(buffer, nullptr, false);
    if (resp.is_discarded()) return json();
    return resp;
}

ActionResult DaemonClient::to_action(const json& resp) {
    if (resp.empty()) return ActionResult::fail(SupervisorError::BackendError, NO_DAEMON);
    if (resp.value("ok", false)) {
        std::string msg;
        if (resp.contains("data") && resp["data"].is_object()) {
            msg = resp["data"].value("message", "");
        }
        return ActionResult::ok(msg);
    }
    SupervisorError err = Protocol::error_from_kind(resp.value("kind", ""));
    if (err == SupervisorError::None) err = SupervisorError::BackendError;
    return ActionResult::fail(err, resp.value("error", "Unknown error"));
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "status"}});
    return !resp.empty() && resp.value("ok", false);
}

DaemonClient::DaemonStatus DaemonClient::get_status() {
    DaemonStatus status;
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty() || !resp.value("ok", false)) return status;

    status.reachable = true;
    if (resp.contains("data") && resp["data"].is_object()) {
        const auto& data = resp["data"];
        status.mode = data.value("mode", "");
        status.sites = data.value("sites", 0);
        status.pid = data.value("pid", -1);
    }
    return status;
}

StatusResult DaemonClient::site_status(const std::string& name) {
    StatusResult result;
    auto resp = send_command({{"cmd", "status"}, {"name", name}});
    if (resp.empty()) {
        result.error = SupervisorError::BackendError;
        result.message = NO_DAEMON;
        return result;
    }
    if (!resp.value("ok", false) || !resp.contains("data")) {
        result.error = Protocol::error_from_kind(resp.value("kind", "backend"));
        result.message = resp.value("error", "Unknown error");
        return result;
    }
    result.success = true;
    result.status = Protocol::status_from_json(resp["data"]);
    return result;
}

std::vector<SiteStatus> DaemonClient::status_all(std::string& err) {
    std::vector<SiteStatus> all;
    auto resp = send_command({{"cmd", "status_all"}});
    if (resp.empty()) {
        err = NO_DAEMON;
        return all;
    }
    if (!resp.value("ok", false) || !resp.contains("data") || !resp["data"].is_array()) {
        err = resp.value("error", "Unknown error");
        return all;
    }
    for (const auto& item : resp["data"]) {
        all.push_back(Protocol::status_from_json(item));
    }
    return all;
}

ActionResult DaemonClient::start(const std::string& name) {
    return to_action(send_command({{"cmd", "start"}, {"name", name}}));
}

ActionResult DaemonClient::stop(const std::string& name) {
    return to_action(send_command({{"cmd", "stop"}, {"name", name}}));
}

ActionResult DaemonClient::restart(const std::string& name) {
    return to_action(send_command({{"cmd", "restart"}, {"name", name}}));
}

LinesResult DaemonClient::tail(const std::string& name, int lines) {
    LinesResult result;
    auto resp = send_command({{"cmd", "tail"}, {"name", name}, {"lines", lines}});
    if (resp.empty()) {
        result.error = SupervisorError::BackendError;
        result.message = NO_DAEMON;
        return result;
    }
    if (!resp.value("ok", false) || !resp.contains("data") || !resp["data"].is_array()) {
        result.error = Protocol::error_from_kind(resp.value("kind", "backend"));
        result.message = resp.value("error", "Unknown error");
        return result;
    }
    result.success = true;
    for (const auto& line : resp["data"]) {
        if (line.is_string()) result.lines.push_back(line.get<std::string>());
    }
    return result;
}

ActionResult DaemonClient::watch(const std::string& name,
                                 const std::function<void(const std::string&)>& callback,
                                 std::atomic<bool>& stop_flag) {
    int fd = connect_socket();
    if (fd < 0) return ActionResult::fail(SupervisorError::BackendError, NO_DAEMON);

    if (!send_line(fd, json({{"cmd", "watch"}, {"name", name}}).dump() + "\n")) {
        close(fd);
        return ActionResult::fail(SupervisorError::BackendError, NO_DAEMON);
    }

    std::string buffer;
    std::string pending;
    bool acked = false;
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;

    while (!stop_flag.load()) {
        int ret = poll(&pfd, 1, 200);
        if (ret < 0 && errno != EINTR) break;
        if (ret <= 0) continue;

        char chunk[4096];
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n <= 0) break;
        pending.append(chunk, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            buffer = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            json msg = json::parse(buffer, nullptr, false);
            if (msg.is_discarded()) continue;

            if (msg.contains("line")) {
                if (msg["line"].is_string()) callback(msg["line"].get<std::string>());
                continue;
            }
            if (!msg.value("ok", false)) {
                close(fd);
                return to_action(msg);
            }
            acked = true;
        }
    }

    close(fd);
    if (!acked && !stop_flag.load()) {
        return ActionResult::fail(SupervisorError::BackendError, "Daemon closed the log stream");
    }
    return ActionResult::ok("Stream closed");
}

std::vector<Site> DaemonClient::list_sites(std::string& err) {
    std::vector<Site> sites;
    auto resp = send_command({{"cmd", "site_list"}});
    if (resp.empty()) {
        err = NO_DAEMON;
        return sites;
    }
    if (!resp.value("ok", false) || !resp.contains("data") || !resp["data"].is_array()) {
        err = resp.value("error", "Unknown error");
        return sites;
    }
    for (const auto& item : resp["data"]) {
        sites.push_back(Protocol::site_from_json(item));
    }
    return sites;
}

ActionResult DaemonClient::add_site(const Site& site, bool start_after_add) {
    return to_action(send_command({{"cmd", "site_add"},
                                   {"site", Protocol::site_to_json(site)},
                                   {"start", start_after_add}}));
}

ActionResult DaemonClient::delete_site(const std::string& name) {
    return to_action(send_command({{"cmd", "site_delete"}, {"name", name}}));
}

ActionResult DaemonClient::reload() {
    return to_action(send_command({{"cmd", "reload"}}));
}
