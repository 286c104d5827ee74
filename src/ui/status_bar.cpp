#include "ui/status_bar.hpp"

#include <ftxui/dom/elements.hpp>

using namespace ftxui;

StatusBar::StatusBar() = default;
StatusBar::~StatusBar() = default;

void StatusBar::set_backend_mode(const std::string& mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
}

void StatusBar::set_counts(int running, int total) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = running;
    total_ = total;
}

void StatusBar::set_daemon_connected(bool connected) {
    connected_.store(connected);
}

void StatusBar::set_message(const std::string& message, bool is_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = message;
    message_error_ = is_error;
}

std::string StatusBar::format_counts(int running, int total) {
    return std::to_string(running) + "/" + std::to_string(total) + " running";
}

Component StatusBar::component() {
    return Renderer([this] {
        std::string mode;
        int running, total;
        std::string message;
        bool message_error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            mode = mode_;
            running = running_;
            total = total_;
            message = message_;
            message_error = message_error_;
        }

        bool is_connected = connected_.load();

        // Left: backend mode
        auto mode_text = text(" " + mode + " ") | bold;

        // Center: last action result
        auto center_text = text(message);
        if (message_error) center_text = center_text | color(Color::Red);

        // Right: counts + daemon status
        auto status_text = is_connected
            ? text(" ● daemon ") | color(Color::Green)
            : text(" ○ local ") | color(Color::Yellow);

        return hbox({
            mode_text,
            filler(),
            center_text,
            filler(),
            text(" " + format_counts(running, total) + " "),
            status_text,
        }) | inverted;
    });
}
