#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

using RequestId = std::variant<int64_t, std::string>;

void to_json(nlohmann::json& j, const RequestId& id);
void from_json(const nlohmann::json& j, RequestId& id);

/// Textual form used to correlate ids, so 7 and "7" name the same request.
[[nodiscard]] std::string id_to_key(const RequestId& id);

struct RpcErrorInfo {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const RpcErrorInfo& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const RpcErrorInfo& e);
void from_json(const nlohmann::json& j, RpcErrorInfo& e);

/// Request in either direction. Inbound requests may name the call with
/// "type" instead of "method"; both land in `method`.
struct RequestMessage {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct ResponseMessage {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<RpcErrorInfo> error;
};

/// {"type":"capability_response", ...}, with or without an id.
struct CapabilityResponseMessage {
    std::optional<RequestId> id;
    nlohmann::json result = nlohmann::json::object();
};

/// Unsolicited {"type":"heartbeat"} liveness message.
struct HeartbeatMessage {
    std::vector<std::string> models;
    nlohmann::json raw;
};

/// Valid JSON object that fits no other shape (notifications, banners).
struct UnknownMessage {
    nlohmann::json raw;
};

using InboundMessage = std::variant<RequestMessage,
                                    ResponseMessage,
                                    CapabilityResponseMessage,
                                    HeartbeatMessage,
                                    UnknownMessage>;

void to_json(nlohmann::json& j, const RequestMessage& r);
void to_json(nlohmann::json& j, const ResponseMessage& r);
void to_json(nlohmann::json& j, const CapabilityResponseMessage& c);
void to_json(nlohmann::json& j, const HeartbeatMessage& h);
void to_json(nlohmann::json& j, const UnknownMessage& u);
void to_json(nlohmann::json& j, const InboundMessage& m);

/// Short label for logs: "request", "response", ...
[[nodiscard]] const char* message_kind(const InboundMessage& m);

} // namespace mcphost
