#pragma once
#include "transport.hpp"
#include <memory>
#include <string>
#include <thread>

namespace mcphost {

/// Transport over the stdio pipes of a spawned child process.
///
/// A reader thread polls stdout, stderr and a wakeup pipe. Stdout is framed
/// into lines and parsed; stderr lines are passed through as diagnostics.
/// Writes are synchronous and serialized.
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(std::string server_id);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    void start(const ServerConfig& config, TransportHandlers handlers) override;
    void send(const RequestMessage& msg) override;
    void dispose(std::chrono::milliseconds grace) override;

    [[nodiscard]] std::optional<int> pid() const override;
    [[nodiscard]] bool is_alive() const override;

    /// Factory producing ProcessTransports, the registry's default.
    [[nodiscard]] static TransportFactory factory();

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
    std::thread reader_thread_;
};

} // namespace mcphost
