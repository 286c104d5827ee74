#pragma once

#include <ftxui/component/component.hpp>
#include <string>
#include <mutex>
#include <atomic>

class StatusBar {
public:
    StatusBar();
    ~StatusBar();

    ftxui::Component component();

    // Thread-safe setters for background updates
    void set_backend_mode(const std::string& mode);
    void set_counts(int running, int total);
    void set_daemon_connected(bool connected);
    void set_message(const std::string& message, bool is_error = false);

    /// "<running>/<total> running"
    static std::string format_counts(int running, int total);

private:
    std::mutex mutex_;
    std::string mode_ = "-";
    int running_ = 0;
    int total_ = 0;
    std::atomic<bool> connected_{false};
    std::string message_;
    bool message_error_ = false;
};
