/**
 * @file process_utils.cpp
 * @brief Implementation of deadline-bounded child process execution
 *
 * **Execution Model**:
 * ```
 * parent                         child (own process group)
 *   pipe(stdout) pipe(stderr) pipe(exec-status, CLOEXEC)
 *   fork() ─────────────────────► setpgid(0,0), chdir, dup2, execvpe
 *   poll() stdout/stderr            │ exec failure: errno -> exec-status pipe
 *   deadline / cancel check         ▼
 *   killpg(SIGTERM) ... grace ... killpg(SIGKILL)
 *   waitpid()
 * ```
 *
 * **Termination Rules**:
 * - Deadline or cancellation: SIGTERM to the group, SIGKILL after kill_grace
 * - Child exited but descendants keep the pipes open: drain for a short
 *   window, then kill the group so the caller never hangs
 *
 * @date 2025
 */

#include "patchbench/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace patchbench {
namespace utils {

namespace {

// How long to keep draining pipes after the direct child has exited
constexpr std::chrono::milliseconds kPostExitDrain{500};

// poll() granularity; bounds the latency of deadline and cancel checks
constexpr int kPollIntervalMs = 100;

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { Close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return fd_; }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void Reset(int fd) {
        Close();
        fd_ = fd;
    }

private:
    int fd_;
};

bool MakePipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return true;
}

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string var(*entry);
        auto eq = var.find('=');
        std::string key = var.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(var));
        }
    }

    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }

    return env;
}

// Drains whatever is readable on fd into buffer. Returns false on EOF.
bool DrainPipe(int fd, BoundedBuffer& buffer) {
    char chunk[8192];

    for (;;) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.Append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more right now. Any other error is treated as EOF.
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void SignalGroup(pid_t pid, int sig) {
    if (::killpg(pid, sig) != 0 && errno != ESRCH) {
        spdlog::debug("killpg({}, {}) failed: {}", pid, sig, std::strerror(errno));
    }
}

} // anonymous namespace

// ============================================================================
// BOUNDED BUFFER
// ============================================================================

void BoundedBuffer::Append(const char* data, std::size_t size) {
    if (max_bytes_ == 0) {
        data_.append(data, size);
        return;
    }

    std::size_t room = data_.size() < max_bytes_ ? max_bytes_ - data_.size() : 0;
    std::size_t take = std::min(room, size);
    data_.append(data, take);

    if (take < size) {
        truncated_ = true;
        discarded_ += size - take;
    }
}

std::string BoundedBuffer::Take() {
    std::string out = std::move(data_);
    data_.clear();

    if (truncated_) {
        std::ostringstream marker;
        marker << "\n[... output truncated: " << discarded_
               << " bytes discarded after " << max_bytes_ << " byte limit ...]\n";
        out += marker.str();
    }

    return out;
}

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argv");
    }

    ProcessResult result;
    const auto start_time = std::chrono::steady_clock::now();

    spdlog::debug("Executing: {}", FormatCommandLine(argv));

    // Everything the child needs is prepared before fork()
    std::vector<std::string> env_strings = BuildEnvironment(options.environment);
    std::vector<char*> env_ptrs;
    env_ptrs.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
        env_ptrs.push_back(entry.data());
    }
    env_ptrs.push_back(nullptr);

    std::vector<std::string> argv_copy = argv;
    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(argv_copy.size() + 1);
    for (auto& arg : argv_copy) {
        argv_ptrs.push_back(arg.data());
    }
    argv_ptrs.push_back(nullptr);

    const std::string working_dir = options.working_dir.string();

    FileDescriptor out_read, out_write, err_read, err_write, status_read, status_write;
    if (!MakePipe(out_read, out_write) || !MakePipe(err_read, err_write) ||
        !MakePipe(status_read, status_write)) {
        result.spawn_failed = true;
        result.error_message = std::string("pipe() failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.error_message = std::string("fork() failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here on
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_write.Get(), STDOUT_FILENO);
        ::dup2(err_write.Get(), STDERR_FILENO);

        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(status_write.Get(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        ::execvpe(argv_ptrs[0], argv_ptrs.data(), env_ptrs.data());

        int err = errno;
        ssize_t ignored = ::write(status_write.Get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    out_write.Close();
    err_write.Close();
    status_write.Close();

    int exec_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = ::read(status_read.Get(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == sizeof(exec_errno)) {
        int wstatus = 0;
        ::waitpid(pid, &wstatus, 0);
        result.spawn_failed = true;
        result.error_message = "Failed to execute '" + argv[0] + "': " + std::strerror(exec_errno);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        spdlog::debug("{}", result.error_message);
        return result;
    }

    ::fcntl(out_read.Get(), F_SETFL, ::fcntl(out_read.Get(), F_GETFL) | O_NONBLOCK);
    ::fcntl(err_read.Get(), F_SETFL, ::fcntl(err_read.Get(), F_GETFL) | O_NONBLOCK);

    BoundedBuffer out_buffer(options.max_output_bytes);
    BoundedBuffer err_buffer(options.max_output_bytes);

    bool out_open = true;
    bool err_open = true;
    bool child_reaped = false;
    int wait_status = 0;

    bool term_sent = false;
    bool kill_sent = false;
    std::chrono::steady_clock::time_point kill_at;
    std::chrono::steady_clock::time_point drain_until;

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start_time + options.timeout;

    while (out_open || err_open || !child_reaped) {
        const auto now = std::chrono::steady_clock::now();

        if (!term_sent) {
            if (has_deadline && now >= deadline) {
                result.timed_out = true;
            } else if (options.cancel != nullptr && options.cancel->IsCancelled()) {
                result.cancelled = true;
            }

            if (result.timed_out || result.cancelled) {
                spdlog::debug("Terminating process group {} ({})", pid,
                              result.timed_out ? "deadline exceeded" : "cancelled");
                SignalGroup(pid, SIGTERM);
                term_sent = true;
                kill_at = now + options.kill_grace;
            }
        } else if (!kill_sent && now >= kill_at) {
            SignalGroup(pid, SIGKILL);
            kill_sent = true;
        }

        if (!child_reaped) {
            pid_t waited = ::waitpid(pid, &wait_status, WNOHANG);
            if (waited == pid) {
                child_reaped = true;
                drain_until = now + kPostExitDrain;
            }
        } else if ((out_open || err_open) && now >= drain_until) {
            // Descendants still hold the pipes; the direct child is gone
            SignalGroup(pid, SIGKILL);
            DrainPipe(out_read.Get(), out_buffer);
            DrainPipe(err_read.Get(), err_buffer);
            out_open = false;
            err_open = false;
            break;
        }

        if (!out_open && !err_open) {
            if (!child_reaped) {
                // Pipes closed but child still running
                std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs / 10));
            }
            continue;
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) {
            fds[nfds++] = {out_read.Get(), POLLIN, 0};
        }
        if (err_open) {
            fds[nfds++] = {err_read.Get(), POLLIN, 0};
        }

        int ready = ::poll(fds, nfds, kPollIntervalMs);
        if (ready < 0 && errno != EINTR) {
            spdlog::warn("poll() failed: {}", std::strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < nfds && ready > 0; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == out_read.Get()) {
                out_open = DrainPipe(out_read.Get(), out_buffer);
            } else {
                err_open = DrainPipe(err_read.Get(), err_buffer);
            }
        }
    }

    if (!child_reaped) {
        SignalGroup(pid, SIGKILL);
        ::waitpid(pid, &wait_status, 0);
    }

    if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.term_signal = WTERMSIG(wait_status);
        result.exit_code = 128 + result.term_signal;
    }

    result.stdout_truncated = out_buffer.Truncated();
    result.stderr_truncated = err_buffer.Truncated();
    result.stdout_output = out_buffer.Take();
    result.stderr_output = err_buffer.Take();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    spdlog::debug("Process {} finished: exit={} signal={} timed_out={} cancelled={} ({} ms)",
                  argv[0], result.exit_code, result.term_signal, result.timed_out,
                  result.cancelled, result.duration.count());

    return result;
}

bool IsProgramAvailable(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::istringstream paths(path_env);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / program;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }

    return false;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::ostringstream oss;

    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        const auto& arg = argv[i];
        bool needs_quotes = arg.empty() || arg.find_first_of(" \t\n'\"\\$`") != std::string::npos;
        if (needs_quotes) {
            oss << '\'';
            for (char c : arg) {
                if (c == '\'') {
                    oss << "'\\''";
                } else {
                    oss << c;
                }
            }
            oss << '\'';
        } else {
            oss << arg;
        }
    }

    return oss.str();
}

} // namespace utils
} // namespace patchbench
