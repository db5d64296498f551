#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace mcphost {

class HostError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Process could not be launched (pipes, fork, exec, working directory).
class SpawnError : public HostError {
public:
    using HostError::HostError;
};

/// One stdout line was not a usable JSON message.
class ParseError : public HostError {
public:
    using HostError::HostError;
};

/// Writing to the child's stdin failed or the transport is closed.
class WriteError : public HostError {
public:
    using HostError::HostError;
};

class RequestTimeoutError : public HostError {
public:
    using HostError::HostError;
};

/// Capability negotiation ran out of time. Logged, never thrown to callers.
class CapabilityTimeoutError : public HostError {
public:
    using HostError::HostError;
};

class ProcessExitError : public HostError {
public:
    using HostError::HostError;
};

class LivenessFailure : public HostError {
public:
    using HostError::HostError;
};

class NotConnectedError : public HostError {
public:
    using HostError::HostError;
};

/// Pending work abandoned because its server is stopping, disposing or removed.
class DisposedError : public HostError {
public:
    using HostError::HostError;
};

class ConfigError : public HostError {
public:
    using HostError::HostError;
};

/// Error reply from a tool server, with the fields it sent.
class RpcError : public HostError {
public:
    int code;
    std::optional<nlohmann::json> data;

    RpcError(int code, const std::string& msg, std::optional<nlohmann::json> data = std::nullopt)
        : HostError(msg), code(code), data(std::move(data)) {}
};

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace error

} // namespace mcphost
