#pragma once
#include "types.hpp"
#include <sys/types.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

/// A spawned child with its stdin, stdout and stderr connected to pipes.
///
/// Reaping is non-blocking and serialized, so a reader thread and a caller
/// shutting the process down can both wait on it safely.
class ChildProcess {
public:
    /// Launch `config`. Exec failures (missing binary, permissions, bad cwd)
    /// are reported here as SpawnError rather than as a later exit.
    [[nodiscard]] static std::unique_ptr<ChildProcess> spawn(const ServerConfig& config);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] int stdin_fd() const noexcept { return stdin_fd_; }
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const noexcept { return stderr_fd_; }

    void close_stdin();

    /// Zero-signal probe; false once the child has been reaped.
    [[nodiscard]] bool is_alive() const;

    /// Reap the child if it has exited. Never blocks.
    std::optional<ExitStatus> try_reap();

    /// Poll for exit up to `timeout`.
    std::optional<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGTERM, wait up to `grace`, then SIGKILL and reap.
    ExitStatus terminate(std::chrono::milliseconds grace);

    /// argv that spawn() will exec for `config`.
    [[nodiscard]] static std::vector<std::string> build_argv(const ServerConfig& config);

    /// Host environment with `overrides` applied, as NAME=value strings.
    [[nodiscard]] static std::vector<std::string> build_env(
        const std::map<std::string, std::string>& overrides);

private:
    ChildProcess(pid_t pid, int in_fd, int out_fd, int err_fd);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex reap_mutex_;
    std::optional<ExitStatus> exit_status_;
};

} // namespace mcphost
