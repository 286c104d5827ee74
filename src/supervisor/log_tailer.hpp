#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

struct TailResult {
    bool success = true;
    std::string error;
    std::vector<std::string> lines;
};

class LogTailer {
public:
    static constexpr int DEFAULT_LINES = 200;

    /// Up to the last n lines of path, in file order.
    /// A missing file is not an error: it yields no lines.
    static TailResult tail(const std::string& path, int n = DEFAULT_LINES);
};

/// Per-viewer read position in a log file. Starts at the current end and
/// returns complete lines appended since the previous poll. Truncation or
/// replacement of the file (new inode) moves the cursor to the new end.
class LogCursor {
public:
    explicit LogCursor(std::string path);

    struct PollResult {
        bool success = true;
        std::string error;
        std::vector<std::string> lines;
    };

    /// Non-blocking: one stat + read of whatever was appended
    PollResult poll();

    uint64_t offset() const { return offset_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    uint64_t offset_ = 0;
    dev_t dev_ = 0;
    ino_t inode_ = 0;
    bool has_identity_ = false;
    bool lost_file_ = false;    // file vanished after we had opened it
    std::string partial_;

    void reset_to_end(uint64_t size, dev_t dev, ino_t inode);
};

struct WatchResult {
    bool success = true;
    std::string error;
};

/// Stream appended lines of path to callback until stop_flag is set or
/// the file becomes unreadable. Sleeps poll_interval_ms between polls.
WatchResult watch_log(const std::string& path,
                      const std::function<void(const std::string&)>& callback,
                      std::atomic<bool>& stop_flag,
                      int poll_interval_ms = 100);
