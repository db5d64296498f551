#pragma once
#include "config.hpp"
#include "health_monitor.hpp"
#include "managed_server.hpp"
#include "status_channel.hpp"
#include "timer_queue.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

/// Owns one ManagedServer per configured id and is the host's single entry
/// point for lifecycle control, method calls and status.
///
/// Construct one and pass it by reference; there is no global instance.
class ServerRegistry {
public:
    /// Consulted when start() names an id the registry has not seen.
    using ConfigSource = std::function<std::optional<ServerConfig>(const std::string& id)>;

    explicit ServerRegistry(RegistryOptions opts = {},
                            TransportFactory factory = nullptr,
                            ConfigSource source = nullptr);
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    // ---- Configuration ----
    void initialize(const std::map<std::string, ServerConfig>& configs);
    /// Adds a server, or replaces the config of an existing one (used on its next start).
    void add_server(const std::string& id, ServerConfig config);
    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> server_ids() const;

    // ---- Lifecycle ----
    void start(const std::string& id);
    void stop(const std::string& id);
    void restart(const std::string& id);
    void remove(const std::string& id);
    /// Starts every server; failures are logged and reported through status events.
    void start_all();
    void stop_all();

    /// Poll with exponential backoff until `id` is Connected.
    bool wait_until_ready(const std::string& id, std::chrono::milliseconds timeout);

    // ---- Traffic ----
    [[nodiscard]] std::future<nlohmann::json> call_method(
        const std::string& id, const std::string& method,
        nlohmann::json params = nlohmann::json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void refresh_capabilities(const std::string& id);

    // ---- Status ----
    [[nodiscard]] std::optional<ServerSnapshot> get_status(const std::string& id) const;
    [[nodiscard]] std::map<std::string, ServerSnapshot> get_all_statuses() const;

    StatusChannel::Token subscribe(StatusChannel::Listener listener);
    bool unsubscribe(StatusChannel::Token token);

    /// Inbound messages that no call or handshake claimed.
    MessageChannel::Token on_message(MessageChannel::Listener listener);
    bool remove_message_listener(MessageChannel::Token token);

    [[nodiscard]] const RegistryOptions& options() const noexcept { return opts_; }

    /// Stop everything and release listeners. Idempotent.
    void dispose();

private:
    std::shared_ptr<ManagedServer> find(const std::string& id) const;
    std::shared_ptr<ManagedServer> find_or_load(const std::string& id);
    std::shared_ptr<ManagedServer> create_locked(const std::string& id, ServerConfig config);

    RegistryOptions opts_;
    TransportFactory factory_;
    ConfigSource source_;

    std::shared_ptr<TimerQueue> timers_;
    std::shared_ptr<StatusChannel> status_channel_;
    std::shared_ptr<MessageChannel> message_channel_;
    std::shared_ptr<HealthMonitor> health_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ManagedServer>> servers_;
    bool disposed_ = false;
};

} // namespace mcphost
