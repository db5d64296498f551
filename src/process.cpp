#include "mcphost/process.hpp"
#include "mcphost/error.hpp"
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace mcphost {

namespace {

constexpr auto REAP_POLL = std::chrono::milliseconds(10);

std::once_flag sigpipe_once;

void ignore_sigpipe() {
    // A child that dies while we write to it must surface as EPIPE, not kill us.
    std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string shell_quote(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$`!*?[]{}()<>|&;#~") == std::string::npos) {
        return arg;
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

ExitStatus decode(int status) {
    ExitStatus st;
    if (WIFEXITED(status)) st.exit_code = WEXITSTATUS(status);
    if (WIFSIGNALED(status)) st.signal = WTERMSIG(status);
    return st;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(int in_fd, int out_fd, int err_fd, int status_fd,
                             const char* cwd, char* const* argv, char* const* envp) {
    ::signal(SIGPIPE, SIG_DFL);
    if (::dup2(in_fd, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0
        || ::dup2(err_fd, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }
    if (cwd && ::chdir(cwd) < 0) {
        int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }
    ::execvpe(argv[0], argv, envp);
    int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

} // anonymous namespace

std::vector<std::string> ChildProcess::build_argv(const ServerConfig& config) {
    if (config.shell) {
        std::string line = config.command;
        for (const auto& a : config.args) {
            line += ' ';
            line += shell_quote(a);
        }
        return {"/bin/sh", "-c", line};
    }
    std::vector<std::string> argv;
    argv.push_back(config.command);
    argv.insert(argv.end(), config.args.begin(), config.args.end());
    return argv;
}

std::vector<std::string> ChildProcess::build_env(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
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

std::unique_ptr<ChildProcess> ChildProcess::spawn(const ServerConfig& config) {
    if (config.command.empty()) {
        throw SpawnError("No command configured");
    }
    ignore_sigpipe();

    // Everything the child needs is built before fork.
    auto argv_strings = build_argv(config);
    auto env_strings = build_env(config.env);
    std::vector<char*> argv;
    for (auto& a : argv_strings) argv.push_back(a.data());
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& e : env_strings) envp.push_back(e.data());
    envp.push_back(nullptr);
    const char* cwd = config.cwd ? config.cwd->c_str() : nullptr;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0
        || ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_all();
        throw SpawnError(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw SpawnError(std::string("Failed to fork process: ") + std::strerror(err));
    }
    if (pid == 0) {
        exec_child(in_pipe[0], out_pipe[1], err_pipe[1], status_pipe[1], cwd,
                   argv.data(), envp.data());
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec; anything read is an errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_all();
        throw SpawnError("Failed to start '" + config.command + "': " + std::strerror(child_errno));
    }

    spdlog::debug("[Process] Spawned '{}' as pid {}", config.command, pid);
    return std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, in_pipe[1], out_pipe[0], err_pipe[0]));
}

ChildProcess::ChildProcess(pid_t pid, int in_fd, int out_fd, int err_fd)
    : pid_(pid), stdin_fd_(in_fd), stdout_fd_(out_fd), stderr_fd_(err_fd) {}

ChildProcess::~ChildProcess() {
    close_fd(stdin_fd_);
    bool reaped;
    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        reaped = exit_status_.has_value();
    }
    if (!reaped) {
        terminate(std::chrono::milliseconds(0));
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ChildProcess::close_stdin() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    close_fd(stdin_fd_);
}

bool ChildProcess::is_alive() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exit_status_) return false;
    return ::kill(pid_, 0) == 0 || errno == EPERM;
}

std::optional<ExitStatus> ChildProcess::try_reap() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exit_status_) return exit_status_;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_status_ = decode(status);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more to learn about it.
        exit_status_ = ExitStatus{};
    }
    return exit_status_;
}

std::optional<ExitStatus> ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto st = try_reap()) return st;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(REAP_POLL);
    }
}

ExitStatus ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (auto st = try_reap()) return *st;

    ::kill(pid_, SIGTERM);
    if (grace.count() > 0) {
        if (auto st = wait_for_exit(grace)) return *st;
    }

    spdlog::debug("[Process] pid {} ignored SIGTERM, sending SIGKILL", pid_);
    ::kill(pid_, SIGKILL);
    while (true) {
        if (auto st = try_reap()) return *st;
        std::this_thread::sleep_for(REAP_POLL);
    }
}

} // namespace mcphost
