#include "ui/site_panel.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <mutex>

using namespace ftxui;

struct SitePanel::Impl {
    Callbacks callbacks;

    std::vector<SiteStatus> sites;
    mutable std::mutex data_mutex;
    int selected = 0;

    void clamp_selection() {
        if (sites.empty()) {
            selected = 0;
            return;
        }
        if (selected < 0) selected = 0;
        if (selected >= (int)sites.size()) selected = (int)sites.size() - 1;
    }

    std::string current_name() const {
        if (selected < 0 || selected >= (int)sites.size()) return "";
        return sites[selected].name;
    }

    Element render_table() {
        auto cell = [](const std::string& s, int width) {
            return text(s) | size(WIDTH, EQUAL, width);
        };

        Elements rows;
        rows.push_back(hbox({
            text("  "),
            cell("NAME", 18),
            cell("STATUS", 10),
            cell("MODE", 12),
            cell("PORT", 7),
            text("COMMAND") | flex,
        }) | bold | dim);

        for (int i = 0; i < (int)sites.size(); ++i) {
            const auto& st = sites[i];
            std::string prefix = (i == selected) ? "▶ " : "  ";
            std::string port = st.port > 0 ? std::to_string(st.port) : "-";

            auto state = st.running()
                ? cell("● running", 10) | color(Color::Green)
                : cell("○ stopped", 10) | color(Color::Red);

            auto line = hbox({
                text(prefix),
                cell(st.name, 18),
                state,
                cell(to_string(st.mode), 12),
                cell(port, 7),
                text(st.cmd) | flex,
            });
            if (i == selected) {
                line = ftxui::focus(line | inverted | bold);
            }
            rows.push_back(line);
        }

        if (sites.empty()) {
            rows.push_back(text("  (no sites configured, add one with `pisite-cpp site add`)") | dim);
        }

        return vbox(std::move(rows)) | vscroll_indicator | yframe | flex;
    }

    Element render_details() {
        if (selected < 0 || selected >= (int)sites.size()) {
            return text("");
        }
        const auto& st = sites[selected];
        Elements items;
        items.push_back(hbox({text(" CWD: ") | dim, text(st.cwd)}));
        items.push_back(hbox({text(" Log: ") | dim, text(st.log)}));
        if (st.pid > 0) {
            items.push_back(hbox({text(" PID: ") | dim, text(std::to_string(st.pid))}));
        }
        return vbox(std::move(items));
    }
};

SitePanel::SitePanel() : impl_(std::make_shared<Impl>()) {}
SitePanel::~SitePanel() = default;

void SitePanel::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

void SitePanel::set_sites(std::vector<SiteStatus> sites) {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    std::string keep = impl_->current_name();
    impl_->sites = std::move(sites);
    for (int i = 0; i < (int)impl_->sites.size(); ++i) {
        if (impl_->sites[i].name == keep) {
            impl_->selected = i;
            break;
        }
    }
    impl_->clamp_selection();
}

std::string SitePanel::selected_name() const {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    return impl_->current_name();
}

Component SitePanel::component() {
    auto self = impl_;

    return Renderer([self](bool /*focused*/) -> Element {
        std::lock_guard<std::mutex> lock(self->data_mutex);

        auto header = hbox({
            text(" Sites ") | bold,
            filler(),
            text(" [S]tart [X]stop [R]estart [Enter]logs ") | dim,
        });

        return vbox({
            header,
            separator(),
            self->render_table(),
            separator(),
            self->render_details(),
        }) | border;
    }) | CatchEvent([self](Event event) -> bool {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(self->data_mutex);
            if (event == Event::ArrowUp || event == Event::Character('k')) {
                self->selected--;
                self->clamp_selection();
                return true;
            }
            if (event == Event::ArrowDown || event == Event::Character('j')) {
                self->selected++;
                self->clamp_selection();
                return true;
            }
            name = self->current_name();
        }
        if (name.empty()) return false;

        // Callbacks run without the data lock: they may call set_sites
        if (event == Event::Return || event == Event::Character('l') || event == Event::Character('L')) {
            if (self->callbacks.on_open_log) self->callbacks.on_open_log(name);
            return true;
        }
        if (event.is_character()) {
            auto ch = event.character();
            std::string op;
            if (ch == "s" || ch == "S") op = "start";
            else if (ch == "x" || ch == "X") op = "stop";
            else if (ch == "r" || ch == "R") op = "restart";
            if (!op.empty()) {
                if (self->callbacks.on_action) self->callbacks.on_action(name, op);
                return true;
            }
        }
        return false;
    });
}
