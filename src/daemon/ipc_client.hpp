#pragma once

#include "supervisor/supervisor.hpp"

#include <atomic>
#include <functional>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

class DaemonClient {
public:
    DaemonClient();
    explicit DaemonClient(std::string socket_path);

    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    struct DaemonStatus {
        bool reachable = false;
        std::string mode;
        int sites = 0;
        int pid = -1;
    };

    /// Get daemon status
    DaemonStatus get_status();

    StatusResult site_status(const std::string& name);
    std::vector<SiteStatus> status_all(std::string& err);

    ActionResult start(const std::string& name);
    ActionResult stop(const std::string& name);
    ActionResult restart(const std::string& name);

    LinesResult tail(const std::string& name, int lines);

    /// Stream appended lines until stop_flag is set or the daemon ends
    /// the stream
    ActionResult watch(const std::string& name,
                       const std::function<void(const std::string&)>& callback,
                       std::atomic<bool>& stop_flag);

    std::vector<Site> list_sites(std::string& err);
    ActionResult add_site(const Site& site, bool start_after_add);
    ActionResult delete_site(const std::string& name);
    ActionResult reload();

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;

    int connect_socket() const;

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);

    ActionResult to_action(const nlohmann::json& resp);
};
