#pragma once

#include "supervisor/supervisor.hpp"

#include <ftxui/component/component.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class SitePanel {
public:
    struct Callbacks {
        // op is "start", "stop" or "restart"
        std::function<void(const std::string& name, const std::string& op)> on_action;
        std::function<void(const std::string& name)> on_open_log;
    };

    SitePanel();
    ~SitePanel();

    void set_callbacks(Callbacks cb);

    /// Replace the table contents (thread-safe); keeps the selection on
    /// the same site name when it still exists
    void set_sites(std::vector<SiteStatus> sites);

    /// Name of the highlighted site, empty if none
    std::string selected_name() const;

    ftxui::Component component();

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};
