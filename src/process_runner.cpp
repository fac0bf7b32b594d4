// =============================================================================
// PosixProcessRunner - posix_spawn + poll
// =============================================================================
#include "process_runner.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace rampart {

namespace {

constexpr const char* TAG = "proc";

// RAII pipe end
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    void reset() { if (fd >= 0) { ::close(fd); fd = -1; } }
};

struct FileActions {
    posix_spawn_file_actions_t fa;
    FileActions() { posix_spawn_file_actions_init(&fa); }
    ~FileActions() { posix_spawn_file_actions_destroy(&fa); }
};

bool makePipe(Fd& rd, Fd& wr) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    rd.fd = fds[0];
    wr.fd = fds[1];
    return true;
}

// Append what is readable; returns false at EOF or error
bool drain(int fd, std::string& out, size_t cap) {
    char buffer[8192];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        if (out.size() < cap) {
            out.append(buffer, std::min(static_cast<size_t>(n), cap - out.size()));
        }
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

} // anonymous namespace

Result<CommandOutput> PosixProcessRunner::run(const std::vector<std::string>& argv,
                                              std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return Err<CommandOutput>("empty command line", ErrorCode::InvalidArgument);
    }

    Fd out_rd, out_wr, err_rd, err_wr;
    if (!makePipe(out_rd, out_wr) || !makePipe(err_rd, err_wr)) {
        return Err<CommandOutput>(std::string("pipe failed: ") + std::strerror(errno),
                                  ErrorCode::IoError);
    }

    FileActions actions;
    posix_spawn_file_actions_addopen(&actions.fa, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions.fa, out_wr.fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions.fa, err_wr.fd, STDERR_FILENO);

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, c_argv[0], &actions.fa, nullptr, c_argv.data(), environ);
    if (rc != 0) {
        ErrorCode code = (rc == ENOENT || rc == EACCES) ? ErrorCode::BridgeUnavailable
                                                        : ErrorCode::IoError;
        return Err<CommandOutput>("spawn " + argv[0] + " failed: " + std::strerror(rc), code);
    }
    out_wr.reset();
    err_wr.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_[pid] = false;
    }

    CommandOutput result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;
    bool killed = false;

    while (out_open || err_open) {
        auto now = std::chrono::steady_clock::now();
        bool cancel_requested = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancel_requested = running_[pid];
        }
        if (cancel_requested || now >= deadline) {
            ::kill(pid, SIGKILL);
            killed = true;
            result.cancelled = cancel_requested;
            result.timed_out = !cancel_requested;
            break;
        }

        // short slices so cancellation is noticed promptly
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), 50));

        pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { out_idx = nfds; fds[nfds++] = {out_rd.fd, POLLIN, 0}; }
        if (err_open) { err_idx = nfds; fds[nfds++] = {err_rd.fd, POLLIN, 0}; }

        int pr = ::poll(fds, nfds, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            RLOG_ERROR(TAG, "poll failed: %s", std::strerror(errno));
            ::kill(pid, SIGKILL);
            killed = true;
            break;
        }
        if (pr == 0) continue;

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            out_open = drain(out_rd.fd, result.stdout_data, MAX_OUTPUT_BYTES);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain(err_rd.fd, result.stderr_data, MAX_OUTPUT_BYTES);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = running_.find(pid);
        // cancelAll() may have killed the child before this loop saw the flag
        if (it != running_.end() && it->second && !killed) {
            killed = true;
            result.cancelled = true;
        }
        running_.erase(pid);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (killed) {
        result.exit_code = -1;
        RLOG_WARN(TAG, "%s %s after %lld ms", argv[0].c_str(),
                  result.cancelled ? "cancelled" : "timed out",
                  static_cast<long long>(timeout.count()));
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.stdout_data.size() >= MAX_OUTPUT_BYTES) {
        RLOG_WARN(TAG, "output truncated (exceeded %zu bytes)", MAX_OUTPUT_BYTES);
    }
    return result;
}

void PosixProcessRunner::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [pid, cancel] : running_) {
        cancel = true;
        // still unreaped here, so the pid cannot have been reused
        ::kill(pid, SIGKILL);
    }
    if (!running_.empty()) {
        RLOG_WARN(TAG, "cancelled %zu in-flight command(s)", running_.size());
    }
}

} // namespace rampart
