#include "mcphost/types.hpp"
#include <csignal>
#include <cstring>

namespace mcphost {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ---------- ServerConfig ----------

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = {{"command", c.command},
         {"args", c.args},
         {"shell", c.shell},
         {"windowsHide", c.windows_hide},
         {"heartbeatEnabled", c.heartbeat_enabled}};
    if (!c.env.empty()) j["env"] = c.env;
    if (c.cwd) j["cwd"] = *c.cwd;
}

// Defaults follow the config file format: shell and windowsHide are on
// unless the entry says otherwise.
void from_json(const nlohmann::json& j, ServerConfig& c) {
    c.command = j.at("command").get<std::string>();
    c.args = j.value("args", std::vector<std::string>{});
    c.env.clear();
    if (j.contains("env") && j.at("env").is_object()) {
        const auto& env = j.at("env");
        for (auto it = env.begin(); it != env.end(); ++it) {
            c.env[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
        }
    }
    c.shell = j.value("shell", true);
    c.windows_hide = j.value("windowsHide", true);
    c.heartbeat_enabled = j.value("heartbeatEnabled", false);
    if (j.contains("cwd") && j.at("cwd").is_string()) c.cwd = j.at("cwd").get<std::string>();
}

// ---------- ToolCapability ----------

void to_json(nlohmann::json& j, const ToolCapability& t) {
    j = {{"name", t.name}};
    if (t.description) j["description"] = *t.description;
    if (t.input_schema) j["inputSchema"] = *t.input_schema;
}

void from_json(const nlohmann::json& j, ToolCapability& t) {
    if (j.is_string()) {
        t.name = j.get<std::string>();
        return;
    }
    t.name = j.at("name").get<std::string>();
    if (j.contains("description") && j.at("description").is_string()) {
        t.description = j.at("description").get<std::string>();
    }
    if (j.contains("inputSchema")) t.input_schema = j.at("inputSchema");
}

// ---------- CapabilityManifest ----------

CapabilityManifest CapabilityManifest::empty() {
    CapabilityManifest m;
    m.discovered_at = now_ms();
    return m;
}

CapabilityManifest CapabilityManifest::from_result(const nlohmann::json& result) {
    CapabilityManifest m;
    from_json(result, m);
    m.discovered_at = now_ms();
    return m;
}

void to_json(nlohmann::json& j, const CapabilityManifest& m) {
    j = {{"models", m.models},
         {"capabilities", m.capabilities},
         {"contextTypes", m.context_types},
         {"discoveredAt", m.discovered_at}};
}

void from_json(const nlohmann::json& j, CapabilityManifest& m) {
    m.models.clear();
    if (j.contains("models") && j.at("models").is_array()) {
        for (const auto& model : j.at("models")) {
            if (model.is_string()) {
                m.models.push_back(model.get<std::string>());
            } else if (model.is_object()) {
                auto name = model.value("id", model.value("name", std::string{}));
                if (!name.empty()) m.models.push_back(std::move(name));
            }
        }
    }
    m.capabilities.clear();
    if (j.contains("capabilities") && j.at("capabilities").is_array()) {
        for (const auto& cap : j.at("capabilities")) {
            if (cap.is_string() || (cap.is_object() && cap.contains("name"))) {
                m.capabilities.push_back(cap.get<ToolCapability>());
            }
        }
    }
    if (j.contains("contextTypes") && j.at("contextTypes").is_array()
        && !j.at("contextTypes").empty()) {
        m.context_types = j.at("contextTypes").get<std::vector<std::string>>();
    } else {
        m.context_types = {"text"};
    }
    m.discovered_at = j.value("discoveredAt", int64_t{0});
}

// ---------- Status ----------

const char* to_string(ServerStatus s) {
    switch (s) {
        case ServerStatus::Disconnected: return "disconnected";
        case ServerStatus::Connecting:   return "connecting";
        case ServerStatus::Connected:    return "connected";
        case ServerStatus::Stopping:     return "stopping";
        case ServerStatus::Error:        return "error";
    }
    return "unknown";
}

std::string ExitStatus::describe() const {
    if (signal) {
        const char* name = ::strsignal(*signal);
        return "terminated by signal " + std::to_string(*signal) +
               (name ? std::string(" (") + name + ")" : std::string());
    }
    if (exit_code) return "exited with code " + std::to_string(*exit_code);
    return "exited";
}

void to_json(nlohmann::json& j, const ServerStatus& s) {
    j = to_string(s);
}

void to_json(nlohmann::json& j, const StatusEvent& e) {
    j = {{"serverId", e.server_id},
         {"status", to_string(e.status)},
         {"models", e.models},
         {"capabilities", e.capabilities}};
    if (e.error) j["error"] = *e.error;
    if (e.pid) j["pid"] = *e.pid;
}

void to_json(nlohmann::json& j, const ServerSnapshot& s) {
    j = {{"serverId", s.server_id},
         {"status", to_string(s.status)},
         {"manifestIsLive", s.manifest_is_live},
         {"pendingRequests", s.pending_requests}};
    if (s.manifest) j["manifest"] = *s.manifest;
    if (s.last_error) j["lastError"] = *s.last_error;
    if (s.pid) j["pid"] = *s.pid;
    if (s.connected_at) j["connectedAt"] = *s.connected_at;
    if (s.last_response_at) j["lastResponseAt"] = *s.last_response_at;
    if (s.last_heartbeat_at) j["lastHeartbeatAt"] = *s.last_heartbeat_at;
}

} // namespace mcphost
