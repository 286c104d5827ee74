#pragma once

#include "supervisor/supervisor.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>

/// JSON shapes shared by the IPC socket, its client and the HTTP API
class Protocol {
public:
    static nlohmann::json status_to_json(const SiteStatus& st);
    static SiteStatus status_from_json(const nlohmann::json& j);

    static nlohmann::json site_to_json(const Site& site);
    static Site site_from_json(const nlohmann::json& j);

    /// "not_found", "backend" or "io"; empty for None
    static std::string error_kind(SupervisorError error);
    static SupervisorError error_from_kind(const std::string& kind);

    /// {"ok": true, "data"?: ...} / {"ok": false, "error": ..., "kind": ...}
    static nlohmann::json ok_response(const nlohmann::json& data);
    static nlohmann::json ok_response();
    static nlohmann::json error_response(SupervisorError error, const std::string& message);
    static nlohmann::json action_response(const ActionResult& result);
};
