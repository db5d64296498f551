#include "mcphost/config.hpp"
#include "mcphost/error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace mcphost {

namespace {

bool is_python(const std::string& command) {
    auto slash = command.find_last_of('/');
    auto base = slash == std::string::npos ? command : command.substr(slash + 1);
    return base.find("python") != std::string::npos;
}

void read_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
        throw ConfigError(std::string("supervisor.") + key + " must be a non-negative integer");
    }
    out = std::chrono::milliseconds(it->get<int64_t>());
}

ServerConfig parse_server(const std::string& id, const nlohmann::json& entry) {
    if (!entry.is_object()) {
        throw ConfigError("Server '" + id + "' must be a JSON object");
    }
    if (entry.contains("url")) {
        throw ConfigError("Server '" + id + "' uses a URL; only stdio servers are supported");
    }
    if (!entry.contains("command") || !entry.at("command").is_string()
        || entry.at("command").get<std::string>().empty()) {
        throw ConfigError("Server '" + id + "' has no command");
    }
    try {
        return normalize_server_config(entry.get<ServerConfig>());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Server '" + id + "' is malformed: " + e.what());
    }
}

} // anonymous namespace

ServerConfig normalize_server_config(ServerConfig config) {
    if (is_python(config.command)
        && std::find(config.args.begin(), config.args.end(), "-u") == config.args.end()) {
        config.args.insert(config.args.begin(), "-u");
    }
    return config;
}

void apply_overrides(RegistryOptions& opts, const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        throw ConfigError("'supervisor' must be a JSON object");
    }
    read_ms(overrides, "settleDelayMs", opts.settle_delay);
    read_ms(overrides, "negotiationTimeoutMs", opts.negotiation_timeout);
    read_ms(overrides, "requestTimeoutMs", opts.request_timeout);
    read_ms(overrides, "disposeGraceMs", opts.dispose_grace);
    read_ms(overrides, "stopGraceMs", opts.stop_grace);
    read_ms(overrides, "healthIntervalMs", opts.health_interval);
    read_ms(overrides, "heartbeatTimeoutMs", opts.heartbeat_timeout);
    read_ms(overrides, "staleSweepIntervalMs", opts.stale_sweep_interval);
    read_ms(overrides, "staleThresholdMs", opts.stale_threshold);
    read_ms(overrides, "restartDelayMs", opts.restart_delay);
    if (overrides.contains("healthChecks")) {
        opts.health_checks = overrides.at("healthChecks").get<bool>();
    }
    if (overrides.contains("failOnStartupStderr")) {
        opts.fail_on_startup_stderr = overrides.at("failOnStartupStderr").get<bool>();
    }
}

HostConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    HostConfig config;
    const nlohmann::json* servers = &j;
    if (j.contains("mcpServers")) {
        servers = &j.at("mcpServers");
        if (!servers->is_object()) {
            throw ConfigError("'mcpServers' must be a JSON object");
        }
    }

    for (auto it = servers->begin(); it != servers->end(); ++it) {
        if (servers == &j && it.key() == "supervisor") continue;
        config.servers.emplace(it.key(), parse_server(it.key(), it.value()));
    }

    if (j.contains("supervisor")) {
        try {
            apply_overrides(config.options, j.at("supervisor"));
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("Invalid supervisor settings: ") + e.what());
        }
    }
    return config;
}

HostConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open configuration file: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }
    auto config = parse_config(j);
    spdlog::info("[Config] Loaded {} server definition(s) from {}", config.servers.size(), path);
    return config;
}

void save_config_file(const std::string& path,
                      const std::map<std::string, ServerConfig>& servers) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [id, cfg] : servers) {
        j[id] = cfg;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw ConfigError("Cannot write configuration file: " + path);
    }
    out << j.dump(2) << '\n';
    if (!out) {
        throw ConfigError("Failed writing configuration file: " + path);
    }
}

} // namespace mcphost
