#include "mcphost/negotiator.hpp"
#include "mcphost/version.hpp"
#include <spdlog/spdlog.h>

namespace mcphost {

CapabilityNegotiator::CapabilityNegotiator(std::string server_id)
    : server_id_(std::move(server_id)) {}

nlohmann::json CapabilityNegotiator::request_params() {
    return {{"client", {{"name", std::string(CLIENT_NAME)},
                        {"version", std::string(LIBRARY_VERSION)}}}};
}

RequestMessage CapabilityNegotiator::begin() {
    active_ = true;
    request_id_ = "cap-" + std::to_string(++rounds_);
    spdlog::info("[Negotiator] [{}] Requesting capabilities ({})", server_id_, request_id_);

    RequestMessage req;
    req.id = request_id_;
    req.method = std::string(CAPABILITY_METHOD);
    req.params = request_params();
    return req;
}

std::optional<CapabilityNegotiator::Resolution>
CapabilityNegotiator::offer(const InboundMessage& msg) {
    if (!active_) return std::nullopt;

    if (auto* cap = std::get_if<CapabilityResponseMessage>(&msg)) {
        return from_result(cap->result);
    }

    // Heartbeats say nothing about capabilities; keep waiting.
    if (std::holds_alternative<HeartbeatMessage>(msg)) return std::nullopt;

    if (auto* resp = std::get_if<ResponseMessage>(&msg)) {
        if (id_to_key(resp->id) == request_id_) {
            if (resp->error) {
                return finish(CapabilityManifest::empty(), true, true,
                              "capability request failed: " + resp->error->message);
            }
            if (resp->result && resp->result->is_object()) {
                return from_result(*resp->result);
            }
            return finish(CapabilityManifest::empty(), true, true,
                          "capability reply carried no result object");
        }
    }

    return finish(CapabilityManifest::empty(), true, false,
                  std::string("unrelated ") + message_kind(msg) + " arrived during negotiation");
}

std::optional<CapabilityNegotiator::Resolution>
CapabilityNegotiator::expire(const std::string& request_id) {
    if (!active_ || request_id != request_id_) return std::nullopt;
    return finish(CapabilityManifest::empty(), true, false, "capability negotiation timed out");
}

CapabilityNegotiator::Resolution CapabilityNegotiator::from_result(const nlohmann::json& result) {
    try {
        return finish(CapabilityManifest::from_result(result), false, true, {});
    } catch (const nlohmann::json::exception& e) {
        return finish(CapabilityManifest::empty(), true, true,
                      std::string("malformed capability result: ") + e.what());
    }
}

void CapabilityNegotiator::cancel() {
    active_ = false;
}

CapabilityNegotiator::Resolution CapabilityNegotiator::finish(CapabilityManifest manifest,
                                                              bool degraded, bool consumed,
                                                              std::string reason) {
    active_ = false;
    if (degraded) {
        spdlog::warn("[Negotiator] [{}] Using empty manifest: {}", server_id_, reason);
    } else {
        spdlog::info("[Negotiator] [{}] Discovered {} model(s), {} capability(ies)", server_id_,
                     manifest.models.size(), manifest.capabilities.size());
    }
    return Resolution{std::move(manifest), degraded, consumed, std::move(reason)};
}

} // namespace mcphost
