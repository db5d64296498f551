#pragma once
#include "../message.hpp"
#include "../types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mcphost {

/// Events raised by a transport, always from its own reader thread.
struct TransportHandlers {
    std::function<void(InboundMessage)> on_message;
    /// A stdout line that failed to parse, and why.
    std::function<void(const std::string& line, const std::string& reason)> on_parse_error;
    /// One stderr line, verbatim.
    std::function<void(const std::string& line)> on_diagnostic;
    /// The process was reaped. Not raised after dispose().
    std::function<void(const ExitStatus&)> on_exit;
};

/// One tool server process behind a message-oriented interface.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Launch the process and begin reading. Throws SpawnError.
    virtual void start(const ServerConfig& config, TransportHandlers handlers) = 0;

    /// Serialize and write one newline-terminated message. Throws WriteError.
    virtual void send(const RequestMessage& msg) = 0;

    /// Detach handlers, close stdin, SIGTERM, SIGKILL after `grace`. Idempotent.
    virtual void dispose(std::chrono::milliseconds grace) = 0;

    [[nodiscard]] virtual std::optional<int> pid() const = 0;
    [[nodiscard]] virtual bool is_alive() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>(const std::string& server_id)>;

} // namespace mcphost
