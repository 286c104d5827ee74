#include "supervisor/log_tailer.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

static constexpr std::streamoff TAIL_BLOCK = 4 * 1024;
static constexpr uint64_t MAX_POLL_CHUNK = 1024 * 1024;

// Split on '\n', dropping a trailing '\r'; no empty entry after a final newline
static std::vector<std::string> split_lines(const std::string& data) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < data.size()) {
        size_t pos = data.find('\n', start);
        if (pos == std::string::npos) pos = data.size();
        std::string line = data.substr(start, pos - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = pos + 1;
    }
    return lines;
}

// ── LogTailer ───────────────────────────────────────────────

TailResult LogTailer::tail(const std::string& path, int n) {
    TailResult result;
    if (n <= 0) return result;

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) return result;
        result.success = false;
        result.error = "Cannot stat " + path + ": " + std::strerror(errno);
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        result.success = false;
        result.error = "Cannot open " + path;
        return result;
    }

    in.seekg(0, std::ios::end);
    std::streamoff pos = in.tellg();
    std::string data;
    const long long wanted = static_cast<long long>(n) + 1;

    // Read backwards in blocks until enough newlines are buffered
    while (pos > 0 && static_cast<long long>(std::count(data.begin(), data.end(), '\n')) <= wanted) {
        std::streamoff step = std::min(TAIL_BLOCK, pos);
        pos -= step;
        std::string block(static_cast<size_t>(step), '\0');
        in.seekg(pos);
        in.read(&block[0], step);
        if (!in) {
            result.success = false;
            result.error = "Read error on " + path;
            return result;
        }
        data.insert(0, block);
    }

    auto lines = split_lines(data);
    if (lines.size() > static_cast<size_t>(n)) {
        lines.erase(lines.begin(), lines.end() - n);
    }
    result.lines = std::move(lines);
    return result;
}

// ── LogCursor ───────────────────────────────────────────────

LogCursor::LogCursor(std::string path) : path_(std::move(path)) {
    struct stat st;
    if (stat(path_.c_str(), &st) == 0) {
        reset_to_end(static_cast<uint64_t>(st.st_size), st.st_dev, st.st_ino);
    }
}

void LogCursor::reset_to_end(uint64_t size, dev_t dev, ino_t inode) {
    offset_ = size;
    dev_ = dev;
    inode_ = inode;
    has_identity_ = true;
    lost_file_ = false;
    partial_.clear();
}

LogCursor::PollResult LogCursor::poll() {
    PollResult result;

    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            // Not created yet, or rotated away and not recreated yet
            if (has_identity_) {
                has_identity_ = false;
                lost_file_ = true;
                partial_.clear();
            }
            return result;
        }
        result.success = false;
        result.error = "Cannot stat " + path_ + ": " + std::strerror(errno);
        return result;
    }

    uint64_t size = static_cast<uint64_t>(st.st_size);

    if (!has_identity_) {
        if (lost_file_) {
            reset_to_end(size, st.st_dev, st.st_ino);
            return result;
        }
        // First appearance of a lazily created log: read it from the start
        dev_ = st.st_dev;
        inode_ = st.st_ino;
        has_identity_ = true;
        offset_ = 0;
    } else if (st.st_dev != dev_ || st.st_ino != inode_ || size < offset_) {
        reset_to_end(size, st.st_dev, st.st_ino);
        return result;
    }

    if (size == offset_) return result;

    int fd = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        result.success = false;
        result.error = "Cannot open " + path_ + ": " + std::strerror(errno);
        return result;
    }

    uint64_t want = std::min(size - offset_, MAX_POLL_CHUNK);
    std::string chunk(static_cast<size_t>(want), '\0');
    size_t got = 0;
    while (got < want) {
        ssize_t n = pread(fd, &chunk[got], want - got, static_cast<off_t>(offset_ + got));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            result.success = false;
            result.error = "Read error on " + path_ + ": " + std::strerror(err);
            return result;
        }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    close(fd);
    chunk.resize(got);
    offset_ += got;

    partial_ += chunk;
    size_t last_nl = partial_.rfind('\n');
    if (last_nl == std::string::npos) return result;

    result.lines = split_lines(partial_.substr(0, last_nl + 1));
    partial_.erase(0, last_nl + 1);
    return result;
}

// ── watch ───────────────────────────────────────────────────

WatchResult watch_log(const std::string& path,
                      const std::function<void(const std::string&)>& callback,
                      std::atomic<bool>& stop_flag,
                      int poll_interval_ms) {
    LogCursor cursor(path);
    if (poll_interval_ms <= 0) poll_interval_ms = 100;

    while (!stop_flag.load()) {
        auto polled = cursor.poll();
        if (!polled.success) {
            return {false, polled.error};
        }
        for (const auto& line : polled.lines) {
            if (stop_flag.load()) break;
            callback(line);
        }

        // Sleep in short slices so cancellation is prompt
        for (int slept = 0; slept < poll_interval_ms && !stop_flag.load(); slept += 20) {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(20, poll_interval_ms - slept)));
        }
    }
    return {true, ""};
}
