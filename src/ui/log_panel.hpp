#pragma once

#include "supervisor/supervisor.hpp"

#include <ftxui/component/component.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class LogPanel {
public:
    struct Callbacks {
        // Initial backlog for a site
        std::function<LinesResult(const std::string& name, int lines)> tail;
        // Stream appended lines. Blocks until stop_flag is set; runs on the panel's thread.
        std::function<ActionResult(const std::string& name,
                                   const std::function<void(const std::string&)>& callback,
                                   std::atomic<bool>& stop_flag)> start_stream;
        // Post event to refresh UI
        std::function<void()> post_refresh;
        // Report export / stream errors
        std::function<void(const std::string& message, bool is_error)> notify;
    };

    static constexpr int MAX_LOG_LINES = 1000;

    LogPanel();
    ~LogPanel();

    void set_callbacks(Callbacks cb);

    /// Show a site's log: load the backlog, then follow it
    void open(const std::string& name);

    /// Stop following (panel hidden)
    void close();

    // Push a log line (thread-safe)
    void push_line(std::string line);

    bool frozen() const;
    void toggle_freeze();

    /// Write the buffered lines to <site>-<timestamp>.log in the
    /// current directory; returns the path or empty on failure
    std::string export_lines();

    std::vector<std::string> lines() const;
    const std::string& site() const;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
