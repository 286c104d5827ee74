#include "app.hpp"
#include "core/config.hpp"
#include "core/site_registry.hpp"
#include "daemon/ipc_client.hpp"
#include "supervisor/backend_selector.hpp"
#include "supervisor/supervisor.hpp"
#include "ui/main_screen.hpp"
#include "ui/site_panel.hpp"
#include "ui/log_panel.hpp"
#include "ui/status_bar.hpp"

#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace ftxui;

struct App::Impl {
    Config config;
    std::unique_ptr<SiteRegistry> registry;
    std::unique_ptr<Supervisor> local;  // used while no daemon is reachable
    DaemonClient daemon_client;

    MainScreen main_screen;
    StatusBar status_bar;
    SitePanel site_panel;
    LogPanel log_panel;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    // Panel management
    int current_panel = 0; // 0=sites, 1=log
    Component panel_container;

    // Background threads
    std::atomic<bool> stop_flag{false};
    std::thread status_thread;
    std::thread action_thread;
    std::atomic<bool> action_busy{false};

    // Cached daemon availability
    std::atomic<bool> daemon_available{false};

    void init_local() {
        config.load();
        const auto& d = config.data();
        Supervisor::Options opts;
        opts.restart_delay_ms = d.restart_delay_ms;
        opts.log_poll_interval_ms = d.log_poll_interval_ms;
        registry = std::make_unique<SiteRegistry>(config);
        local = std::make_unique<Supervisor>(*registry, BackendSelector::select(d), opts);
    }

    void notify(const std::string& message, bool is_error) {
        status_bar.set_message(message, is_error);
        screen.Post(Event::Custom);
    }

    void refresh_sites() {
        bool daemon = daemon_client.is_daemon_running();
        daemon_available.store(daemon);
        status_bar.set_daemon_connected(daemon);
        main_screen.set_daemon_connected(daemon);

        std::vector<SiteStatus> all;
        std::string mode;
        if (daemon) {
            std::string err;
            all = daemon_client.status_all(err);
            if (!err.empty()) notify(err, true);
            mode = daemon_client.get_status().mode;
        } else {
            // Pick up sites added from the CLI; a missing or broken
            // file keeps the previous list
            if (!registry->reload() && std::filesystem::exists(Config::config_path())) {
                status_bar.set_message("Config file unreadable, showing last known sites", true);
            }
            all = local->status_all();
            mode = to_string(local->mode());
        }

        int running = 0;
        for (const auto& st : all) {
            if (st.running()) running++;
        }
        status_bar.set_counts(running, (int)all.size());
        status_bar.set_backend_mode(mode);
        main_screen.set_backend_mode(mode);
        site_panel.set_sites(std::move(all));
    }

    void run_action(const std::string& name, const std::string& op) {
        if (action_busy.load()) {
            notify("Busy: previous action still running", true);
            return;
        }
        if (action_thread.joinable()) action_thread.join();

        action_busy.store(true);
        notify(op + " " + name + "...", false);
        action_thread = std::thread([this, name, op]() {
            ActionResult result;
            if (daemon_available.load()) {
                if (op == "start") result = daemon_client.start(name);
                else if (op == "stop") result = daemon_client.stop(name);
                else result = daemon_client.restart(name);
            } else {
                if (op == "start") result = local->start(name);
                else if (op == "stop") result = local->stop(name);
                else result = local->restart(name);
            }
            notify(result.message, !result.success);
            refresh_sites();
            action_busy.store(false);
            screen.Post(Event::Custom);
        });
    }

    void open_log(const std::string& name) {
        current_panel = 1;
        log_panel.open(name);
    }

    void back() {
        if (current_panel == 1) {
            log_panel.close();
            current_panel = 0;
        }
    }

    void setup_callbacks() {
        MainScreen::Callbacks cb;
        cb.on_quit = [this]() { screen.Exit(); };
        cb.on_back = [this]() { back(); };
        main_screen.set_callbacks(std::move(cb));

        SitePanel::Callbacks scb;
        scb.on_action = [this](const std::string& name, const std::string& op) {
            run_action(name, op);
        };
        scb.on_open_log = [this](const std::string& name) { open_log(name); };
        site_panel.set_callbacks(std::move(scb));

        LogPanel::Callbacks lcb;
        lcb.tail = [this](const std::string& name, int lines) {
            if (daemon_available.load()) return daemon_client.tail(name, lines);
            return local->tail(name, lines);
        };
        lcb.start_stream = [this](const std::string& name,
                                  const std::function<void(const std::string&)>& callback,
                                  std::atomic<bool>& stop) {
            if (daemon_available.load()) return daemon_client.watch(name, callback, stop);
            return local->watch(name, callback, stop);
        };
        lcb.post_refresh = [this]() { screen.Post(Event::Custom); };
        lcb.notify = [this](const std::string& message, bool is_error) { notify(message, is_error); };
        log_panel.set_callbacks(std::move(lcb));
    }

    void start_status_thread() {
        status_thread = std::thread([this]() {
            while (!stop_flag.load()) {
                refresh_sites();

                // Post a custom event to trigger UI refresh
                screen.Post(Event::Custom);

                // Sleep 2 seconds, checking stop_flag every 100ms
                for (int i = 0; i < 20 && !stop_flag.load(); ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
            }
        });
    }

    void stop_threads() {
        stop_flag.store(true);
        if (status_thread.joinable()) {
            status_thread.join();
        }
        if (action_thread.joinable()) {
            action_thread.join();
        }
        log_panel.close();
    }
};

App::App() : impl_(std::make_unique<Impl>()) {
    // Load config (use defaults if file doesn't exist)
    impl_->init_local();

    // Setup UI
    impl_->setup_callbacks();

    // Panel container (Tab-based switching)
    impl_->panel_container = Container::Tab({
        impl_->site_panel.component(),
        impl_->log_panel.component(),
    }, &impl_->current_panel);

    impl_->main_screen.set_content(impl_->panel_container);
    impl_->main_screen.set_status_bar(impl_->status_bar.component());
}

App::~App() {
    impl_->stop_threads();
}

void App::run() {
    // Start background threads
    impl_->start_status_thread();

    // Run the TUI
    impl_->screen.Loop(impl_->main_screen.component());

    // Cleanup
    impl_->stop_threads();
}
