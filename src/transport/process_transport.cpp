#include "mcphost/transport/process_transport.hpp"
#include "mcphost/codec.hpp"
#include "mcphost/error.hpp"
#include "mcphost/line_framer.hpp"
#include "mcphost/process.hpp"
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace mcphost {

struct ProcessTransport::Impl {
    std::string server_id;
    std::unique_ptr<ChildProcess> child;

    std::atomic<bool> running{false};
    std::atomic<bool> disposed{false};
    int wakeup_pipe[2]{-1, -1};

    std::mutex handlers_mutex;
    TransportHandlers handlers;

    std::mutex write_mutex;
    bool stdin_open = false;

    explicit Impl(std::string id) : server_id(std::move(id)) {}

    ~Impl() {
        if (wakeup_pipe[0] >= 0) ::close(wakeup_pipe[0]);
        if (wakeup_pipe[1] >= 0) ::close(wakeup_pipe[1]);
    }

    TransportHandlers current_handlers() {
        std::lock_guard<std::mutex> lock(handlers_mutex);
        return handlers;
    }

    void wake() {
        if (wakeup_pipe[1] >= 0) {
            char b = 1;
            (void)!::write(wakeup_pipe[1], &b, 1);
        }
    }

    void deliver_line(const std::string& line) {
        spdlog::trace("[Transport] [{}] <- {}", server_id, line);
        auto h = current_handlers();

        InboundMessage msg;
        try {
            msg = Codec::parse(line);
        } catch (const ParseError& e) {
            spdlog::warn("[Transport] [{}] Dropping unparseable line: {}", server_id, e.what());
            if (h.on_parse_error) h.on_parse_error(line, e.what());
            return;
        }

        if (!h.on_message) return;
        try {
            h.on_message(std::move(msg));
        } catch (const std::exception& e) {
            spdlog::error("[Transport] [{}] Message handler threw: {}", server_id, e.what());
        }
    }

    void deliver_diagnostic(const std::string& line) {
        spdlog::warn("[Transport] [{}][stderr] {}", server_id, line);
        auto h = current_handlers();
        if (!h.on_diagnostic) return;
        try {
            h.on_diagnostic(line);
        } catch (const std::exception& e) {
            spdlog::error("[Transport] [{}] Diagnostic handler threw: {}", server_id, e.what());
        }
    }

    void deliver_exit(const ExitStatus& st) {
        if (disposed) return;
        spdlog::info("[Transport] [{}] Process {}", server_id, st.describe());
        auto h = current_handlers();
        if (!h.on_exit) return;
        try {
            h.on_exit(st);
        } catch (const std::exception& e) {
            spdlog::error("[Transport] [{}] Exit handler threw: {}", server_id, e.what());
        }
    }

    // Returns false once the stream reached EOF or failed.
    bool pump(int fd, LineFramer& framer, bool is_stdout) {
        char chunk[4096];
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return true;
            spdlog::error("[Transport] [{}] Read error on {}: {}", server_id,
                          is_stdout ? "stdout" : "stderr", std::strerror(errno));
        }
        if (n <= 0) {
            auto rest = framer.take_remainder();
            if (!rest.empty()) {
                if (is_stdout) deliver_line(rest);
                else deliver_diagnostic(rest);
            }
            return false;
        }

        std::vector<std::string> lines;
        try {
            lines = framer.append(std::string_view(chunk, static_cast<size_t>(n)));
        } catch (const ParseError& e) {
            spdlog::warn("[Transport] [{}] {}", server_id, e.what());
            if (is_stdout) {
                auto h = current_handlers();
                if (h.on_parse_error) h.on_parse_error(std::string(), e.what());
            }
            return true;
        }
        for (const auto& line : lines) {
            if (!running) break;
            if (is_stdout) deliver_line(line);
            else deliver_diagnostic(line);
        }
        return true;
    }

    void read_loop() {
        LineFramer out_framer;
        LineFramer err_framer;
        bool out_open = true;
        bool err_open = true;

        while (running) {
            struct pollfd fds[3];
            nfds_t count = 0;
            fds[count++] = {wakeup_pipe[0], POLLIN, 0};
            int out_idx = -1;
            int err_idx = -1;
            if (out_open) {
                out_idx = static_cast<int>(count);
                fds[count++] = {child->stdout_fd(), POLLIN, 0};
            }
            if (err_open) {
                err_idx = static_cast<int>(count);
                fds[count++] = {child->stderr_fd(), POLLIN, 0};
            }

            // Once stdout is gone, wake up periodically to reap the child.
            int ret = ::poll(fds, count, out_open ? -1 : 50);
            if (ret < 0) {
                if (errno == EINTR) continue;
                spdlog::error("[Transport] [{}] poll failed: {}", server_id, std::strerror(errno));
                break;
            }

            // Wakeup pipe → dispose() was called
            if (fds[0].revents & POLLIN) break;

            constexpr short readable = POLLIN | POLLHUP | POLLERR;
            if (out_idx >= 0 && (fds[out_idx].revents & readable)) {
                out_open = pump(child->stdout_fd(), out_framer, true);
            }
            if (err_idx >= 0 && (fds[err_idx].revents & readable)) {
                err_open = pump(child->stderr_fd(), err_framer, false);
            }

            if (!out_open && running) {
                if (auto st = child->try_reap()) {
                    drain_stderr(err_open, err_framer);
                    deliver_exit(*st);
                    break;
                }
            }
        }
        running = false;
    }

    void drain_stderr(bool& err_open, LineFramer& framer) {
        while (err_open) {
            struct pollfd pfd{child->stderr_fd(), POLLIN, 0};
            if (::poll(&pfd, 1, 0) <= 0) break;
            err_open = pump(child->stderr_fd(), framer, false);
        }
    }
};

ProcessTransport::ProcessTransport(std::string server_id)
    : impl_(std::make_shared<Impl>(std::move(server_id))) {}

ProcessTransport::~ProcessTransport() {
    dispose(std::chrono::milliseconds(0));
    if (reader_thread_.joinable()) {
        // Destroyed from one of our own handlers: the thread holds its own
        // reference to Impl and exits once it sees running == false.
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
}

void ProcessTransport::start(const ServerConfig& config, TransportHandlers handlers) {
    if (impl_->disposed) {
        throw SpawnError("Transport for " + impl_->server_id + " was disposed");
    }
    if (impl_->child) {
        throw SpawnError("Transport for " + impl_->server_id + " already started");
    }

    if (::pipe2(impl_->wakeup_pipe, O_CLOEXEC) < 0) {
        throw SpawnError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(impl_->wakeup_pipe[1], F_GETFL, 0);
    ::fcntl(impl_->wakeup_pipe[1], F_SETFL, flags | O_NONBLOCK);

    impl_->child = ChildProcess::spawn(config);
    // A peer that stops reading must not wedge send() past dispose().
    int in_flags = ::fcntl(impl_->child->stdin_fd(), F_GETFL, 0);
    ::fcntl(impl_->child->stdin_fd(), F_SETFL, in_flags | O_NONBLOCK);
    {
        std::lock_guard<std::mutex> lock(impl_->handlers_mutex);
        impl_->handlers = std::move(handlers);
    }
    {
        std::lock_guard<std::mutex> lock(impl_->write_mutex);
        impl_->stdin_open = true;
    }
    impl_->running = true;
    reader_thread_ = std::thread([impl = impl_]() { impl->read_loop(); });

    spdlog::info("[Transport] [{}] Started '{}' (pid {})", impl_->server_id, config.command,
                 impl_->child->pid());
}

void ProcessTransport::send(const RequestMessage& msg) {
    std::string data = Codec::serialize(msg);
    spdlog::trace("[Transport] [{}] -> {}", impl_->server_id, data);
    data += '\n';

    std::lock_guard<std::mutex> lock(impl_->write_mutex);
    if (!impl_->stdin_open || !impl_->child) {
        throw WriteError("Transport for " + impl_->server_id + " is closed");
    }

    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        if (impl_->disposed) {
            throw WriteError("Transport for " + impl_->server_id + " was disposed mid-write");
        }
        ssize_t written = ::write(impl_->child->stdin_fd(), p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Pipe full: wait in short slices so dispose() can cut us off.
                struct pollfd pfd{impl_->child->stdin_fd(), POLLOUT, 0};
                ::poll(&pfd, 1, 20);
                continue;
            }
            throw WriteError("Write to " + impl_->server_id + " failed: " + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void ProcessTransport::dispose(std::chrono::milliseconds grace) {
    if (impl_->disposed.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(impl_->handlers_mutex);
        impl_->handlers = TransportHandlers{};
    }
    impl_->running = false;
    impl_->wake();

    if (!impl_->child) return;
    {
        std::lock_guard<std::mutex> lock(impl_->write_mutex);
        impl_->stdin_open = false;
        impl_->child->close_stdin();
    }

    auto st = impl_->child->terminate(grace);
    spdlog::debug("[Transport] [{}] Disposed; process {}", impl_->server_id, st.describe());
}

std::optional<int> ProcessTransport::pid() const {
    if (!impl_->child) return std::nullopt;
    return static_cast<int>(impl_->child->pid());
}

bool ProcessTransport::is_alive() const {
    return impl_->child && impl_->child->is_alive();
}

TransportFactory ProcessTransport::factory() {
    return [](const std::string& server_id) -> std::unique_ptr<ITransport> {
        return std::make_unique<ProcessTransport>(server_id);
    };
}

} // namespace mcphost
