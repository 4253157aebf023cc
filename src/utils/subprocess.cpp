/**
 * @file subprocess.cpp
 * @brief fork/exec with pipes, rlimits and process-group termination
 *
 * **Child setup, in order**:
 * 1. stdin/stdout/stderr redirected to pipes
 * 2. New process group (setpgid) so Kill() reaches grandchildren
 * 3. umask 077, inherited descriptors closed
 * 4. chdir into the working directory
 * 5. Optional network namespace (unshare)
 * 6. PR_SET_NO_NEW_PRIVS, PR_SET_PDEATHSIG
 * 7. setrlimit for CPU, address space, file size, open files
 * 8. execvpe with a scrubbed environment (no LD_PRELOAD / LD_LIBRARY_PATH)
 *
 * Everything the child needs is prepared before fork(); the child itself
 * only calls async-signal-safe functions.
 *
 * @date 2025
 */

#include "crucible/utils/subprocess.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

extern char** environ;

namespace crucible {
namespace utils {

namespace {

constexpr int kExitSetupFailed = 126;
constexpr int kExitExecFailed = 127;
constexpr std::chrono::milliseconds kPollSlice{50};
constexpr std::chrono::milliseconds kDrainGrace{250};

std::once_flag g_sigpipe_once;

void IgnoreSigpipe() {
    std::call_once(g_sigpipe_once, []() {
        std::signal(SIGPIPE, SIG_IGN);
    });
}

void ChildFail(const char* message, int code) {
    ssize_t ignored = write(STDERR_FILENO, message, std::strlen(message));
    (void)ignored;
    _exit(code);
}

void SetLimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

bool EnterNetworkNamespace() {
    if (unshare(CLONE_NEWNET) == 0) {
        return true;
    }
    return unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0;
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void AppendCapped(std::string& buffer, const char* data, std::size_t size,
                  std::size_t cap, bool& truncated) {
    buffer.append(data, size);
    if (buffer.size() > cap * 2) {
        buffer.erase(0, buffer.size() - cap);
        truncated = true;
    }
}

/// Read everything currently available; returns false once the pipe hit EOF
bool DrainFd(int fd, std::string& buffer, std::size_t cap, bool& truncated) {
    char chunk[4096];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            AppendCapped(buffer, chunk, static_cast<std::size_t>(n), cap, truncated);
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    merged.erase("LD_PRELOAD");
    merged.erase("LD_LIBRARY_PATH");
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // anonymous namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

Subprocess::Subprocess(SubprocessOptions options)
    : options_(std::move(options)) {
}

Subprocess::~Subprocess() {
    if (pid_ > 0) {
        bool reaped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reaped = reaped_;
        }
        if (!reaped) {
            Kill();
            int status = 0;
            std::lock_guard<std::mutex> lock(mutex_);
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
            reaped_ = true;
        }
    }
    CloseFds();
}

bool Subprocess::Start() {
    if (pid_ > 0) {
        error_ = "subprocess already started";
        return false;
    }
    if (options_.argv.empty() || options_.argv[0].empty()) {
        error_ = "empty argv";
        return false;
    }
    if (kill_requested_.load()) {
        error_ = "killed before start";
        return false;
    }

    IgnoreSigpipe();

    // Prepare everything the child needs before forking
    std::vector<char*> argv;
    argv.reserve(options_.argv.size() + 1);
    for (const auto& arg : options_.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = BuildEnvironment(options_.environment);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::string cwd = options_.working_directory.string();
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 256) {
        max_fd = 256;
    }
    max_fd = std::min(max_fd, 65536L);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) != 0 ||
        pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0) {
        error_ = std::string("pipe failed: ") + std::strerror(errno);
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            if (fd >= 0) {
                close(fd);
            }
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    started_at_ = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid < 0) {
        error_ = std::string("fork failed: ") + std::strerror(errno);
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            close(fd);
        }
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        (void)setpgid(0, 0);
        (void)umask(077);

        for (int fd = 3; fd < max_fd; ++fd) {
            (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            ChildFail("crucible: cannot enter working directory\n", kExitSetupFailed);
        }

        if (options_.isolate_network && !EnterNetworkNamespace()) {
            ChildFail("crucible: network isolation unavailable\n", kExitSetupFailed);
        }

#ifdef __linux__
        if (options_.limits.no_new_privileges) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        const ProcessLimits& lim = options_.limits;
        if (lim.cpu_seconds > 0) {
            SetLimit(RLIMIT_CPU, static_cast<rlim_t>(lim.cpu_seconds),
                     static_cast<rlim_t>(lim.cpu_seconds + 1));
        }
        if (lim.address_space_bytes > 0) {
            SetLimit(RLIMIT_AS, static_cast<rlim_t>(lim.address_space_bytes),
                     static_cast<rlim_t>(lim.address_space_bytes));
        }
        if (lim.file_size_bytes > 0) {
            SetLimit(RLIMIT_FSIZE, static_cast<rlim_t>(lim.file_size_bytes),
                     static_cast<rlim_t>(lim.file_size_bytes));
        }
        if (lim.open_files > 0) {
            SetLimit(RLIMIT_NOFILE, static_cast<rlim_t>(lim.open_files),
                     static_cast<rlim_t>(lim.open_files));
        }

        execvpe(argv[0], argv.data(), envp.data());
        ChildFail("crucible: exec failed\n", kExitExecFailed);
    }

    // parent
    (void)setpgid(pid, pid);
    pid_ = pid;

    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    SetNonBlocking(stdin_fd_);
    SetNonBlocking(stdout_fd_);
    SetNonBlocking(stderr_fd_);

    if (options_.stdin_data.empty()) {
        CloseFd(stdin_fd_);
    }

    spdlog::debug("Started pid {}: {}", pid, StringUtils::FormatCommand(options_.argv));
    return true;
}

// ============================================================================
// WAITING
// ============================================================================

bool Subprocess::TryReap(int* status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
        return true;
    }
    pid_t w = waitpid(pid_, status, WNOHANG);
    if (w == pid_) {
        reaped_ = true;
    }
    return reaped_;
}

SubprocessResult Subprocess::Wait(std::optional<std::chrono::milliseconds> timeout) {
    SubprocessResult result;
    if (pid_ <= 0) {
        result.error = error_.empty() ? "subprocess not started" : error_;
        return result;
    }
    if (waited_) {
        result.error = "subprocess already waited for";
        return result;
    }
    waited_ = true;
    result.started = true;

    const std::size_t cap = std::max<std::size_t>(options_.max_output_bytes, 1);
    std::size_t stdin_offset = 0;
    int status = 0;
    bool exited = false;
    std::optional<std::chrono::steady_clock::time_point> exited_at;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at_);

        if (!exited && TryReap(&status)) {
            exited = true;
            exited_at = now;
        }

        if (exited && stdout_fd_ < 0 && stderr_fd_ < 0) {
            break;
        }

        // Pipes still held open by a background grandchild
        if (exited && exited_at && now - *exited_at > kDrainGrace) {
            (void)kill(-pid_, SIGKILL);
            if (stdout_fd_ >= 0) {
                DrainFd(stdout_fd_, result.stdout_output, cap, result.output_truncated);
            }
            if (stderr_fd_ >= 0) {
                DrainFd(stderr_fd_, result.stderr_output, cap, result.output_truncated);
            }
            break;
        }

        if (!exited && timeout && elapsed >= *timeout && !result.timed_out) {
            result.timed_out = true;
            spdlog::debug("pid {} exceeded {}ms, killing", pid_, timeout->count());
            Kill();
        }

        std::vector<struct pollfd> fds;
        if (stdout_fd_ >= 0) {
            fds.push_back({stdout_fd_, POLLIN, 0});
        }
        if (stderr_fd_ >= 0) {
            fds.push_back({stderr_fd_, POLLIN, 0});
        }
        if (stdin_fd_ >= 0) {
            fds.push_back({stdin_fd_, POLLOUT, 0});
        }

        auto slice = kPollSlice;
        if (timeout && !result.timed_out && *timeout > elapsed) {
            slice = std::min(slice, *timeout - elapsed);
            slice = std::max(slice, std::chrono::milliseconds(1));
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(exited ? std::chrono::milliseconds(1) : slice);
            continue;
        }

        int ready = poll(fds.data(), fds.size(), static_cast<int>(slice.count()));
        if (ready < 0 && errno != EINTR) {
            spdlog::warn("poll failed for pid {}: {}", pid_, std::strerror(errno));
            std::this_thread::sleep_for(slice);
            continue;
        }

        for (const auto& pfd : fds) {
            if (pfd.revents == 0) {
                continue;
            }
            if (pfd.fd == stdout_fd_) {
                if (!DrainFd(stdout_fd_, result.stdout_output, cap, result.output_truncated)) {
                    CloseFd(stdout_fd_);
                }
            } else if (pfd.fd == stderr_fd_) {
                if (!DrainFd(stderr_fd_, result.stderr_output, cap, result.output_truncated)) {
                    CloseFd(stderr_fd_);
                }
            } else if (pfd.fd == stdin_fd_) {
                if (pfd.revents & (POLLERR | POLLHUP)) {
                    CloseFd(stdin_fd_);
                    continue;
                }
                const std::string& data = options_.stdin_data;
                ssize_t n = write(stdin_fd_, data.data() + stdin_offset, data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    CloseFd(stdin_fd_);
                }
                if (stdin_offset >= data.size()) {
                    CloseFd(stdin_fd_);
                }
            }
        }
    }

    CloseFds();

    for (std::string* buffer : {&result.stdout_output, &result.stderr_output}) {
        if (buffer->size() > cap) {
            buffer->erase(0, buffer->size() - cap);
            result.output_truncated = true;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    } else {
        result.exit_code = 128;
    }

    result.killed = kill_requested_.load();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    return result;
}

void Subprocess::Kill() {
    kill_requested_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0 && !reaped_) {
        (void)kill(-pid_, SIGKILL);
        (void)kill(pid_, SIGKILL);
    }
}

void Subprocess::CloseFds() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

// ============================================================================
// CONVENIENCE
// ============================================================================

SubprocessResult RunCommand(const SubprocessOptions& options,
                            std::optional<std::chrono::milliseconds> timeout) {
    Subprocess proc(options);
    if (!proc.Start()) {
        SubprocessResult result;
        result.error = proc.GetError();
        return result;
    }
    return proc.Wait(timeout);
}

bool ProbeNetworkIsolation() {
    SubprocessOptions options;
    options.argv = {"sh", "-c", "exit 0"};
    options.isolate_network = true;
    auto result = RunCommand(options, std::chrono::seconds(5));
    return result.started && result.exit_code == 0;
}

} // namespace utils
} // namespace crucible
