#pragma once
#include "message.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mcphost {

/// Typed fan-out list. Listeners are called outside the lock, in
/// subscription order; one that throws is logged and the rest still run.
template <typename Event>
class Broadcast {
public:
    using Listener = std::function<void(const Event&)>;
    using Token = uint64_t;

    explicit Broadcast(std::string name) : name_(std::move(name)) {}

    Token subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        Token token = next_token_++;
        listeners_.emplace(token, std::move(listener));
        return token;
    }

    bool unsubscribe(Token token) {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.erase(token) > 0;
    }

    void publish(const Event& event) const {
        std::vector<Listener> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(listeners_.size());
            for (const auto& entry : listeners_) snapshot.push_back(entry.second);
        }
        for (const auto& listener : snapshot) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                spdlog::error("[{}] Listener threw: {}", name_, e.what());
            }
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.clear();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<Token, Listener> listeners_;
    Token next_token_{1};
};

/// Inbound message no pending call or handshake claimed.
struct ServerMessage {
    std::string server_id;
    InboundMessage message;
};

using StatusChannel = Broadcast<StatusEvent>;
using MessageChannel = Broadcast<ServerMessage>;

} // namespace mcphost
