#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

// ---------- Server definition ----------

struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // overlays the host environment
    bool shell = false;                       // run through /bin/sh -c
    bool windows_hide = true;                 // carried for config round-trips; no effect on POSIX
    bool heartbeat_enabled = false;
    std::optional<std::string> cwd;

    bool operator==(const ServerConfig& o) const {
        return command == o.command && args == o.args && env == o.env
               && shell == o.shell && windows_hide == o.windows_hide
               && heartbeat_enabled == o.heartbeat_enabled && cwd == o.cwd;
    }
    bool operator!=(const ServerConfig& o) const { return !(*this == o); }
};

// ---------- Capabilities ----------

struct ToolCapability {
    std::string name;
    std::optional<std::string> description;
    std::optional<nlohmann::json> input_schema;

    bool operator==(const ToolCapability& o) const {
        return name == o.name && description == o.description && input_schema == o.input_schema;
    }
};

struct CapabilityManifest {
    std::vector<std::string> models;
    std::vector<ToolCapability> capabilities;
    std::vector<std::string> context_types{"text"};
    int64_t discovered_at = 0;   // ms since epoch

    /// Manifest used when a server never describes itself.
    [[nodiscard]] static CapabilityManifest empty();

    /// Build from a capability result object; absent fields take defaults.
    [[nodiscard]] static CapabilityManifest from_result(const nlohmann::json& result);
};

// ---------- Lifecycle ----------

enum class ServerStatus {
    Disconnected,
    Connecting,
    Connected,
    Stopping,
    Error
};

[[nodiscard]] const char* to_string(ServerStatus s);

/// How a child process ended.
struct ExitStatus {
    std::optional<int> exit_code;
    std::optional<int> signal;

    [[nodiscard]] std::string describe() const;
};

struct StatusEvent {
    std::string server_id;
    ServerStatus status = ServerStatus::Disconnected;
    std::optional<std::string> error;
    std::optional<int> pid;
    std::vector<std::string> models;
    std::vector<ToolCapability> capabilities;
};

/// Point-in-time view of one managed server.
struct ServerSnapshot {
    std::string server_id;
    ServerStatus status = ServerStatus::Disconnected;
    std::optional<CapabilityManifest> manifest;   // live manifest, else the last one seen
    bool manifest_is_live = false;
    std::optional<std::string> last_error;
    std::optional<int> pid;
    std::optional<int64_t> connected_at;
    std::optional<int64_t> last_response_at;
    std::optional<int64_t> last_heartbeat_at;
    std::size_t pending_requests = 0;
};

/// Wall-clock milliseconds since epoch.
[[nodiscard]] int64_t now_ms();

// ---------- JSON ----------

void to_json(nlohmann::json& j, const ServerConfig& c);
void from_json(const nlohmann::json& j, ServerConfig& c);

void to_json(nlohmann::json& j, const ToolCapability& t);
void from_json(const nlohmann::json& j, ToolCapability& t);

void to_json(nlohmann::json& j, const CapabilityManifest& m);
void from_json(const nlohmann::json& j, CapabilityManifest& m);

void to_json(nlohmann::json& j, const ServerStatus& s);
void to_json(nlohmann::json& j, const StatusEvent& e);
void to_json(nlohmann::json& j, const ServerSnapshot& s);

} // namespace mcphost
