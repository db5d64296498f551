#include "mcphost/message.hpp"
#include "mcphost/error.hpp"
#include "mcphost/version.hpp"

namespace mcphost {

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw ParseError("Request ID must be integer or string");
    }
}

std::string id_to_key(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const RpcErrorInfo& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

// Tool servers are not always strict about the error shape: accept a bare
// string and fill in missing fields.
void from_json(const nlohmann::json& j, RpcErrorInfo& e) {
    if (j.is_string()) {
        e.code = error::InternalError;
        e.message = j.get<std::string>();
        return;
    }
    if (!j.is_object()) {
        e.code = error::InternalError;
        e.message = j.dump();
        return;
    }
    e.code = j.contains("code") && j.at("code").is_number_integer()
                 ? j.at("code").get<int>()
                 : error::InternalError;
    e.message = j.contains("message") && j.at("message").is_string()
                    ? j.at("message").get<std::string>()
                    : std::string("Unknown error");
    if (j.contains("data")) e.data = j.at("data");
}

void to_json(nlohmann::json& j, const RequestMessage& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const ResponseMessage& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        nlohmann::json err_j;
        to_json(err_j, *r.error);
        j["error"] = err_j;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
}

void to_json(nlohmann::json& j, const CapabilityResponseMessage& c) {
    j = nlohmann::json{{"type", "capability_response"}, {"result", c.result}};
    if (c.id) {
        nlohmann::json id_j;
        to_json(id_j, *c.id);
        j["id"] = id_j;
    }
}

void to_json(nlohmann::json& j, const HeartbeatMessage& h) {
    if (h.raw.is_object()) {
        j = h.raw;
        return;
    }
    j = nlohmann::json{{"type", "heartbeat"}, {"models", h.models}};
}

void to_json(nlohmann::json& j, const UnknownMessage& u) {
    j = u.raw;
}

void to_json(nlohmann::json& j, const InboundMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

const char* message_kind(const InboundMessage& m) {
    switch (m.index()) {
        case 0: return "request";
        case 1: return "response";
        case 2: return "capability_response";
        case 3: return "heartbeat";
        default: return "unknown";
    }
}

} // namespace mcphost
