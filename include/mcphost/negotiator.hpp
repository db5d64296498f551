#pragma once
#include "message.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace mcphost {

/// Capability handshake state for one connection attempt.
///
/// Purely reactive: the owner sends the request returned by begin(), feeds
/// inbound messages to offer(), and calls expire() when its timer fires.
/// Whichever of those finishes the round first produces the only Resolution;
/// afterwards the negotiator is idle and ignores everything.
class CapabilityNegotiator {
public:
    struct Resolution {
        CapabilityManifest manifest;
        bool degraded = false;          // empty manifest stands in for a real one
        bool consumed_message = false;  // the offered message was the capability reply
        std::string reason;             // why a degraded round ended
    };

    explicit CapabilityNegotiator(std::string server_id);

    /// Start a round and return the capability request to send.
    [[nodiscard]] RequestMessage begin();

    /// Returns a Resolution if `msg` ends the current round.
    std::optional<Resolution> offer(const InboundMessage& msg);

    /// Timer expiry for the round identified by `request_id`.
    std::optional<Resolution> expire(const std::string& request_id);

    /// Abandon the current round without a result.
    void cancel();

    [[nodiscard]] bool active() const noexcept { return active_; }
    [[nodiscard]] const std::string& request_id() const noexcept { return request_id_; }

    [[nodiscard]] static nlohmann::json request_params();

private:
    Resolution from_result(const nlohmann::json& result);
    Resolution finish(CapabilityManifest manifest, bool degraded, bool consumed,
                      std::string reason);

    std::string server_id_;
    bool active_ = false;
    std::string request_id_;
    uint64_t rounds_ = 0;
};

} // namespace mcphost
