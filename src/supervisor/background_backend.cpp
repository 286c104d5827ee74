#include "supervisor/background_backend.hpp"
#include "core/shell.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace fs = std::filesystem;

static constexpr int EXEC_FAILURE_EXIT_CODE = 127;

BackgroundBackend::BackgroundBackend(Options opts) : opts_(std::move(opts)) {
    // Line-buffer stdout/stderr of the whole tree when coreutils stdbuf exists
    stdbuf_path_ = Shell::find_executable("stdbuf");
    shell_path_ = Shell::find_executable(opts_.shell);
    if (shell_path_.empty()) shell_path_ = opts_.shell;
}

BackgroundBackend::~BackgroundBackend() = default;

std::string BackgroundBackend::pid_file(const std::string& name) const {
    return (fs::path(opts_.pid_dir) / (name + ".pid")).string();
}

pid_t BackgroundBackend::read_pid(const std::string& name) const {
    std::ifstream in(pid_file(name));
    if (!in.is_open()) return -1;

    std::string content;
    std::getline(in, content);
    try {
        long value = std::stol(content);
        if (value <= 0) return -1;
        return static_cast<pid_t>(value);
    } catch (const std::exception&) {
        return -1;
    }
}

bool BackgroundBackend::write_pid(const std::string& name, pid_t pid, std::string& err) const {
    try {
        fs::create_directories(opts_.pid_dir);
    } catch (const fs::filesystem_error& e) {
        err = std::string("Cannot create pid dir: ") + e.what();
        return false;
    }

    std::string path = pid_file(name);
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            err = "Cannot write pid file: " + tmp;
            return false;
        }
        out << pid;
        out.flush();
        if (!out) {
            err = "Cannot write pid file: " + tmp;
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        err = "Cannot write pid file: " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

void BackgroundBackend::remove_pid(const std::string& name) const {
    std::error_code ec;
    fs::remove(pid_file(name), ec);
}

bool BackgroundBackend::group_alive(pid_t pgid) {
    if (pgid <= 0) return false;
    if (kill(-pgid, 0) == 0) return true;
    return errno == EPERM;
}

void BackgroundBackend::reap(pid_t pid) {
    // Collect the leader if it is our own child, otherwise a zombie would
    // keep the group looking alive. ECHILD means someone else owns it.
    int status;
    while (waitpid(pid, &status, WNOHANG) < 0 && errno == EINTR) {
    }
}

bool BackgroundBackend::wait_for_exit(pid_t pgid, int timeout_ms) const {
    for (int waited = 0; waited <= timeout_ms; waited += 100) {
        reap(pgid);
        if (!group_alive(pgid)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    reap(pgid);
    return !group_alive(pgid);
}

pid_t BackgroundBackend::spawn(const Site& site, std::string& err) const {
    // Everything the child needs is prepared before fork
    std::vector<std::string> args;
    if (!stdbuf_path_.empty()) {
        args = {stdbuf_path_, "-oL", "-eL"};
    }
    args.push_back(shell_path_);
    args.push_back(opts_.login_shell ? "-lc" : "-c");
    args.push_back(site.cmd);

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "PYTHONUNBUFFERED=", 17) == 0) continue;
        env_strings.emplace_back(*e);
    }
    env_strings.emplace_back("PYTHONUNBUFFERED=1");
    std::vector<char*> envp;
    for (auto& e : env_strings) envp.push_back(e.data());
    envp.push_back(nullptr);

    std::string log_path = site.log_path();
    std::string cwd = site.cwd;
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 4096) max_fd = 4096;

    // Error pipe reports setup/exec failures back from the child
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        return -1;
    }

    pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return -1;
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);
        auto fail = [&](int code) {
            (void)!write(err_pipe[1], &code, sizeof(code));
            _exit(EXEC_FAILURE_EXIT_CODE);
        };

        // New session: the child leads its own process group
        if (setsid() < 0) fail(errno);

        // Undo the supervisor's signal setup; ignored dispositions survive exec
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        if (chdir(cwd.c_str()) < 0) fail(errno);

        int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (log_fd < 0) fail(errno);
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd < 0) fail(errno);

        if (dup2(null_fd, STDIN_FILENO) < 0) fail(errno);
        if (dup2(log_fd, STDOUT_FILENO) < 0) fail(errno);
        if (dup2(log_fd, STDERR_FILENO) < 0) fail(errno);
        if (log_fd > STDERR_FILENO) close(log_fd);
        if (null_fd > STDERR_FILENO) close(null_fd);

        // Do not leak supervisor sockets into the site
        for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
            if (fd != err_pipe[1]) close(fd);
        }

        execve(argv[0], argv.data(), envp.data());
        fail(errno);
    }

    // Parent process
    close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        err = std::string("spawn failed: ") + std::strerror(child_errno);
        return -1;
    }
    return pid;
}

ActionResult BackgroundBackend::start(const Site& site) {
    std::error_code ec;
    if (site.cwd.empty() || !fs::is_directory(site.cwd, ec)) {
        return ActionResult::fail(SupervisorError::BackendError,
                                  "CWD does not exist: " + site.cwd);
    }

    pid_t existing = read_pid(site.name);
    if (existing > 0) {
        reap(existing);
        if (group_alive(existing)) {
            return ActionResult::ok(site.name + " already running (pid " +
                                    std::to_string(existing) + ")");
        }
        spdlog::debug("[Background] Clearing stale pid {} for {}", existing, site.name);
        remove_pid(site.name);
    }

    std::string err;
    pid_t pid = spawn(site, err);
    if (pid < 0) {
        spdlog::error("[Background] Failed to start {}: {}", site.name, err);
        return ActionResult::fail(SupervisorError::BackendError,
                                  "Failed to start " + site.name + ": " + err);
    }

    if (!write_pid(site.name, pid, err)) {
        // Without a pid file the group would be unreachable later
        killpg(pid, SIGKILL);
        wait_for_exit(pid, 1000);
        spdlog::error("[Background] Failed to record pid for {}: {}", site.name, err);
        return ActionResult::fail(SupervisorError::BackendError,
                                  "Failed to start " + site.name + ": " + err);
    }

    spdlog::info("[Background] Started {} (pgid {})", site.name, pid);
    return ActionResult::ok("Started " + site.name + " (pid " + std::to_string(pid) + ")");
}

ActionResult BackgroundBackend::stop(const Site& site) {
    if (!fs::exists(pid_file(site.name))) {
        return ActionResult::ok("No pid for " + site.name);
    }

    pid_t pgid = read_pid(site.name);
    if (pgid <= 0) {
        remove_pid(site.name);
        return ActionResult::ok("Invalid pid file removed for " + site.name);
    }

    reap(pgid);
    if (!group_alive(pgid)) {
        remove_pid(site.name);
        return ActionResult::ok("Process not found. Cleared pid for " + site.name);
    }

    // Send SIGTERM first
    if (killpg(pgid, SIGTERM) < 0) {
        if (errno == ESRCH) {
            remove_pid(site.name);
            return ActionResult::ok("Process not found. Cleared pid for " + site.name);
        }
        std::string cause = std::strerror(errno);
        spdlog::error("[Background] Failed to signal {} (pgid {}): {}", site.name, pgid, cause);
        return ActionResult::fail(SupervisorError::BackendError,
                                  "Failed to stop " + site.name + ": " + cause);
    }

    // Wait for graceful exit, then force kill
    if (!wait_for_exit(pgid, opts_.stop_grace_ms)) {
        spdlog::warn("[Background] {} ignored SIGTERM, sending SIGKILL", site.name);
        killpg(pgid, SIGKILL);
        if (!wait_for_exit(pgid, 2000)) {
            return ActionResult::fail(SupervisorError::BackendError,
                                      "Failed to stop " + site.name + ": group still alive after SIGKILL");
        }
    }

    remove_pid(site.name);
    spdlog::info("[Background] Stopped {} (pgid {})", site.name, pgid);
    return ActionResult::ok("Stopped " + site.name + " (pid " + std::to_string(pgid) + ")");
}

ProbeResult BackgroundBackend::status(const Site& site) {
    ProbeResult result;
    if (!fs::exists(pid_file(site.name))) return result;

    pid_t pgid = read_pid(site.name);
    if (pgid > 0) {
        reap(pgid);
        if (group_alive(pgid)) {
            result.state = RunState::Running;
            result.pid = pgid;
            return result;
        }
    }

    // Stale or invalid pid file: heal silently
    remove_pid(site.name);
    return result;
}
