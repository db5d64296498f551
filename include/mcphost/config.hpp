#pragma once
#include "backoff.hpp"
#include "types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace mcphost {

/// Timing and policy knobs for a ServerRegistry.
struct RegistryOptions {
    std::chrono::milliseconds settle_delay{150};
    std::chrono::milliseconds negotiation_timeout{30000};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds dispose_grace{1000};
    std::chrono::milliseconds stop_grace{1000};
    std::chrono::milliseconds health_interval{3000};
    std::chrono::milliseconds heartbeat_timeout{10000};
    std::chrono::milliseconds stale_sweep_interval{std::chrono::minutes(10)};
    std::chrono::milliseconds stale_threshold{std::chrono::minutes(5)};
    std::chrono::milliseconds restart_delay{1000};
    BackoffPolicy ready_backoff;
    bool health_checks = true;
    bool fail_on_startup_stderr = false;
};

/// Everything a configuration file describes.
struct HostConfig {
    std::map<std::string, ServerConfig> servers;
    RegistryOptions options;
};

/// Accepts {"mcpServers": {...}} or a flat {id: {...}} map, plus an optional
/// "supervisor" object of millisecond overrides. Throws ConfigError.
[[nodiscard]] HostConfig parse_config(const nlohmann::json& j);

[[nodiscard]] HostConfig load_config_file(const std::string& path);

/// Writes the flat form, pretty-printed.
void save_config_file(const std::string& path,
                      const std::map<std::string, ServerConfig>& servers);

/// Python servers get "-u" so their stdio is unbuffered.
[[nodiscard]] ServerConfig normalize_server_config(ServerConfig config);

void apply_overrides(RegistryOptions& opts, const nlohmann::json& overrides);

} // namespace mcphost
