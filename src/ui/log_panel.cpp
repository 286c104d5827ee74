#include "ui/log_panel.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <deque>
#include <mutex>
#include <thread>
#include <fstream>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace ftxui;

struct LogPanel::Impl {
    Callbacks callbacks;
    std::string site;

    std::deque<std::string> logs;
    mutable std::mutex log_mutex;

    std::atomic<bool> frozen{false};
    std::string stream_error;

    std::atomic<bool> stream_stop{true};
    std::thread stream_thread;

    void start_streaming() {
        if (!callbacks.start_stream) return;
        stream_stop.store(false);
        std::string name = site;
        stream_thread = std::thread([this, name]() {
            auto result = callbacks.start_stream(name,
                [this](const std::string& line) {
                    push(line);
                    if (callbacks.post_refresh) {
                        callbacks.post_refresh();
                    }
                },
                stream_stop);
            if (!result.success) {
                {
                    std::lock_guard<std::mutex> lock(log_mutex);
                    stream_error = result.message;
                }
                if (callbacks.notify) callbacks.notify(result.message, true);
                if (callbacks.post_refresh) callbacks.post_refresh();
            }
        });
    }

    void stop_streaming() {
        stream_stop.store(true);
        if (stream_thread.joinable()) {
            stream_thread.join();
        }
    }

    void push(std::string line) {
        std::lock_guard<std::mutex> lock(log_mutex);
        logs.push_back(std::move(line));
        while ((int)logs.size() > MAX_LOG_LINES) {
            logs.pop_front();
        }
    }

    std::string export_logs() {
        std::lock_guard<std::mutex> lock(log_mutex);
        auto t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << (site.empty() ? "pisite" : site) << "-"
            << std::put_time(&tm, "%Y%m%d-%H%M%S") << ".log";

        std::ofstream out(oss.str());
        if (!out.is_open()) return "";
        for (const auto& line : logs) {
            out << line << "\n";
        }
        out.close();
        if (!out) return "";
        return oss.str();
    }
};

LogPanel::LogPanel() : impl_(std::make_unique<Impl>()) {}
LogPanel::~LogPanel() {
    impl_->stop_streaming();
}

void LogPanel::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

void LogPanel::open(const std::string& name) {
    impl_->stop_streaming();
    {
        std::lock_guard<std::mutex> lock(impl_->log_mutex);
        impl_->site = name;
        impl_->logs.clear();
        impl_->stream_error.clear();
    }
    impl_->frozen.store(false);

    if (impl_->callbacks.tail) {
        auto result = impl_->callbacks.tail(name, MAX_LOG_LINES);
        if (result.success) {
            for (auto& line : result.lines) impl_->push(std::move(line));
        } else if (impl_->callbacks.notify) {
            impl_->callbacks.notify(result.message, true);
        }
    }
    impl_->start_streaming();
}

void LogPanel::close() { impl_->stop_streaming(); }

void LogPanel::push_line(std::string line) { impl_->push(std::move(line)); }

bool LogPanel::frozen() const { return impl_->frozen.load(); }

void LogPanel::toggle_freeze() { impl_->frozen.store(!impl_->frozen.load()); }

std::string LogPanel::export_lines() { return impl_->export_logs(); }

std::vector<std::string> LogPanel::lines() const {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    return std::vector<std::string>(impl_->logs.begin(), impl_->logs.end());
}

const std::string& LogPanel::site() const { return impl_->site; }

Component LogPanel::component() {
    auto self = impl_.get();

    return Renderer([self](bool /*focused*/) -> Element {
        std::lock_guard<std::mutex> lock(self->log_mutex);
        bool frozen = self->frozen.load();

        auto header = hbox({
            text(" " + self->site + " ") | bold | color(Color::Cyan),
            text(" " + std::to_string(self->logs.size()) + " lines ") | dim,
            filler(),
            frozen
                ? text(" [F] Frozen ") | color(Color::Yellow)
                : text(" [F] Freeze ") | dim,
            text(" [E] Export ") | dim,
            text(" [Esc] Back ") | dim,
        });

        Elements lines;
        for (const auto& line : self->logs) {
            lines.push_back(text(line));
        }
        if (!self->stream_error.empty()) {
            lines.push_back(text("  stream ended: " + self->stream_error) | color(Color::Red));
        }
        if (lines.empty()) {
            lines.push_back(text("  (no logs)") | dim);
        }

        auto log_view = vbox(std::move(lines));
        if (!frozen) {
            log_view = log_view | focusPositionRelative(0, 1); // auto-scroll to bottom
        }

        return vbox({
            header,
            separator(),
            log_view | vscroll_indicator | frame | flex,
        }) | border;
    }) | CatchEvent([self](Event event) -> bool {
        if (event.is_character()) {
            // F: toggle freeze
            if (event.character() == "f" || event.character() == "F") {
                self->frozen.store(!self->frozen.load());
                return true;
            }

            // E: export
            if (event.character() == "e" || event.character() == "E") {
                std::string path = self->export_logs();
                if (self->callbacks.notify) {
                    if (path.empty()) self->callbacks.notify("Export failed", true);
                    else self->callbacks.notify("Exported to " + path, false);
                }
                return true;
            }
        }

        return false;
    });
}
