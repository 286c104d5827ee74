#pragma once

#include <ftxui/component/component.hpp>
#include <string>
#include <functional>
#include <memory>

class MainScreen {
public:
    struct Callbacks {
        std::function<void()> on_quit;
        std::function<void()> on_back;  // Esc when no panel consumed it
    };

    MainScreen();
    ~MainScreen();

    void set_callbacks(Callbacks cb);
    void set_backend_mode(const std::string& mode);
    void set_daemon_connected(bool connected);

    // Set the main content component (site table or log panel)
    void set_content(ftxui::Component content);

    // Set the status bar component
    void set_status_bar(ftxui::Component status_bar);

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
