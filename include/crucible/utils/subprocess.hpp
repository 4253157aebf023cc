/**
 * @file subprocess.hpp
 * @brief Child process execution with separate stdout/stderr capture,
 *        POSIX resource limits and asynchronous termination
 *
 * Every child runs in its own process group so that Kill() takes down the
 * whole subtree. Kill() may be called from any thread while another thread
 * is blocked in Wait().
 *
 * @note Starting the first subprocess sets SIGPIPE to SIG_IGN for the whole
 *       process so that writing to a child that already exited reports EPIPE.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace utils {

/**
 * @struct ProcessLimits
 * @brief setrlimit() values applied in the child before exec
 *
 * Zero leaves the inherited limit untouched.
 */
struct ProcessLimits {
    std::int64_t cpu_seconds{0};          ///< RLIMIT_CPU (SIGXCPU at soft, SIGKILL at soft+1)
    std::int64_t address_space_bytes{0};  ///< RLIMIT_AS
    std::int64_t file_size_bytes{0};      ///< RLIMIT_FSIZE
    int open_files{0};                    ///< RLIMIT_NOFILE
    bool no_new_privileges{true};         ///< PR_SET_NO_NEW_PRIVS
};

/**
 * @struct SubprocessOptions
 * @brief What to run and how
 */
struct SubprocessOptions {
    std::vector<std::string> argv;                    ///< argv[0] is looked up in PATH
    std::filesystem::path working_directory;          ///< Empty keeps the parent's cwd
    std::map<std::string, std::string> environment;   ///< Added to the inherited environment
    std::string stdin_data;                           ///< Written to stdin, then closed
    ProcessLimits limits;
    bool isolate_network{false};                      ///< Run in a fresh network namespace
    std::size_t max_output_bytes{1024 * 1024};        ///< Per stream; the most recent bytes are kept
};

/**
 * @struct SubprocessResult
 * @brief Exit status and captured output of a finished child
 */
struct SubprocessResult {
    bool started{false};
    int exit_code{-1};          ///< Exit status, or 128 + signal number
    int term_signal{0};         ///< Terminating signal, 0 on normal exit
    std::string stdout_output;
    std::string stderr_output;
    bool output_truncated{false};
    bool timed_out{false};      ///< Wait() timeout expired and the child was killed
    bool killed{false};         ///< Kill() was requested
    std::chrono::milliseconds elapsed{0};
    std::string error;          ///< Spawn failure description
};

/**
 * @class Subprocess
 * @brief One child process, started once and waited for once
 *
 * **Usage**:
 * @code
 * SubprocessOptions options;
 * options.argv = {"sh", "-c", "echo hello"};
 * Subprocess proc(options);
 * if (proc.Start()) {
 *     auto result = proc.Wait(std::chrono::seconds(5));
 * }
 * @endcode
 */
class Subprocess {
public:
    explicit Subprocess(SubprocessOptions options);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /**
     * @brief Fork and exec the child
     * @return false on spawn failure (see GetError())
     */
    bool Start();

    /**
     * @brief Pump I/O until the child exits
     * @param timeout Kill the child once this much time has passed since Start()
     */
    SubprocessResult Wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief SIGKILL the child's process group (thread-safe, idempotent)
     */
    void Kill();

    const std::string& GetError() const { return error_; }

private:
    bool TryReap(int* status);
    void CloseFds();

    SubprocessOptions options_;
    int pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::mutex mutex_;               ///< Guards pid_ against reaping races
    bool reaped_{false};
    bool waited_{false};
    std::atomic<bool> kill_requested_{false};

    std::chrono::steady_clock::time_point started_at_;
    std::string error_;
};

/**
 * @brief Start, wait and collect in one call
 */
SubprocessResult RunCommand(const SubprocessOptions& options,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/**
 * @brief Check whether children can be placed in a private network namespace
 *
 * Tries CLONE_NEWNET first and falls back to an unprivileged user namespace.
 */
bool ProbeNetworkIsolation();

} // namespace utils
} // namespace crucible
