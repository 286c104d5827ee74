#include "daemon/protocol.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

json Protocol::status_to_json(const SiteStatus& st) {
    return {
        {"name", st.name},
        {"running", st.running()},
        {"mode", to_string(st.mode)},
        {"pid", st.pid},
        {"port", st.port},
        {"cwd", st.cwd},
        {"cmd", st.cmd},
        {"log", st.log}
    };
}

SiteStatus Protocol::status_from_json(const json& j) {
    SiteStatus st;
    st.name = j.value("name", "");
    st.state = j.value("running", false) ? RunState::Running : RunState::Stopped;
    st.mode = j.value("mode", "") == "session" ? BackendMode::Session : BackendMode::Background;
    st.pid = j.value("pid", -1);
    st.port = j.value("port", 0);
    st.cwd = j.value("cwd", "");
    st.cmd = j.value("cmd", "");
    st.log = j.value("log", "");
    return st;
}

json Protocol::site_to_json(const Site& site) {
    return {
        {"name", site.name},
        {"cwd", site.cwd},
        {"cmd", site.cmd},
        {"port", site.port},
        {"log", site.log},
        {"autostart", site.autostart},
        {"autorestart", site.autorestart}
    };
}

Site Protocol::site_from_json(const json& j) {
    Site site;
    site.name = j.value("name", "");
    site.cwd = j.value("cwd", "");
    site.cmd = j.value("cmd", "");
    site.port = j.value("port", 0);
    site.log = j.value("log", "activity.log");
    if (site.log.empty()) site.log = "activity.log";
    site.autostart = j.value("autostart", false);
    site.autorestart = j.value("autorestart", false);
    return site;
}

std::string Protocol::error_kind(SupervisorError error) {
    switch (error) {
        case SupervisorError::NotFound: return "not_found";
        case SupervisorError::BackendError: return "backend";
        case SupervisorError::IOError: return "io";
        case SupervisorError::None: break;
    }
    return "";
}

SupervisorError Protocol::error_from_kind(const std::string& kind) {
    if (kind == "not_found") return SupervisorError::NotFound;
    if (kind == "backend") return SupervisorError::BackendError;
    if (kind == "io") return SupervisorError::IOError;
    return SupervisorError::None;
}

json Protocol::ok_response(const json& data) {
    return {{"ok", true}, {"data", data}};
}

json Protocol::ok_response() {
    return {{"ok", true}};
}

json Protocol::error_response(SupervisorError error, const std::string& message) {
    json resp = {{"ok", false}, {"error", message}};
    std::string kind = error_kind(error);
    if (!kind.empty()) resp["kind"] = kind;
    return resp;
}

json Protocol::action_response(const ActionResult& result) {
    if (result.success) return ok_response(json{{"message", result.message}});
    return error_response(result.error, result.message);
}
