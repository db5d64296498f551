#pragma once
#include "config.hpp"
#include "correlator.hpp"
#include "health_monitor.hpp"
#include "negotiator.hpp"
#include "timer_queue.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcphost {

/// Lifecycle of one configured tool server:
///
///   Disconnected -> Connecting -> Connected -> Stopping -> Disconnected
///
/// with Error reachable from any state. Every transition goes through one
/// routine that queues a StatusEvent; the queue is drained in order by a
/// single dispatcher at a time, outside the state lock.
///
/// Transport handlers and timers are tagged with the generation they were
/// created for, so events from a retired process are ignored.
class ManagedServer : public std::enable_shared_from_this<ManagedServer> {
public:
    using StatusSink = std::function<void(const StatusEvent&)>;
    using MessageSink = std::function<void(const std::string& server_id, const InboundMessage&)>;

    ManagedServer(std::string id, ServerConfig config, RegistryOptions opts,
                  TransportFactory factory, std::shared_ptr<TimerQueue> timers,
                  StatusSink on_status, MessageSink on_message);
    ~ManagedServer();

    ManagedServer(const ManagedServer&) = delete;
    ManagedServer& operator=(const ManagedServer&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    /// Spawn and begin negotiating. No-op while Connecting or Connected.
    /// Throws SpawnError (after moving to Error) if the process cannot start.
    void start();

    /// Stop the process and reject pending calls. No-op while Disconnected.
    void stop();

    /// Re-run the capability handshake on the live connection.
    void refresh_capabilities();

    /// Throws NotConnectedError unless Connected.
    [[nodiscard]] std::future<nlohmann::json> call(
        const std::string& method, nlohmann::json params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Health monitor verdict: Connected -> Disconnected with `reason`.
    void mark_disconnected(const std::string& reason);

    /// Final shutdown; the server cannot be started again.
    void dispose(const std::string& reason);

    /// Takes effect on the next start.
    void set_config(ServerConfig config);
    [[nodiscard]] ServerConfig config() const;

    [[nodiscard]] ServerStatus status() const;
    [[nodiscard]] ServerSnapshot snapshot() const;
    [[nodiscard]] std::optional<HealthSample> health_sample() const;
    [[nodiscard]] std::size_t pending_count() const;

private:
    using Clock = std::chrono::steady_clock;

    TransportHandlers make_handlers(uint64_t generation);
    void begin_negotiation(uint64_t generation);
    void negotiation_expired(uint64_t generation, const std::string& request_id);
    void handle_message(uint64_t generation, InboundMessage msg);
    void handle_diagnostic(uint64_t generation, const std::string& line);
    void handle_exit(uint64_t generation, const ExitStatus& st);
    void send_capability_request(uint64_t generation, const std::shared_ptr<ITransport>& transport,
                                 const RequestMessage& req);
    bool is_current(uint64_t generation) const;

    /// Error transition for the connection of `generation`.
    void fail(uint64_t generation, const std::string& reason, std::exception_ptr pending_error);

    // Callers hold mutex_.
    void apply_resolution_locked(CapabilityNegotiator::Resolution res);
    void set_status_locked(ServerStatus s, std::optional<std::string> error = std::nullopt);
    void cancel_timers_locked();
    std::shared_ptr<ITransport> detach_connection_locked();

    void flush_events();

    const std::string id_;
    const RegistryOptions opts_;
    TransportFactory factory_;
    std::shared_ptr<TimerQueue> timers_;
    StatusSink on_status_;
    MessageSink on_message_;
    std::shared_ptr<RequestCorrelator> correlator_;

    // Serializes start/stop/dispose; recursive so a status listener may call back in.
    std::recursive_mutex lifecycle_mutex_;

    mutable std::mutex mutex_;
    ServerConfig config_;
    ServerStatus status_{ServerStatus::Disconnected};
    bool disposed_ = false;
    uint64_t generation_ = 0;
    std::shared_ptr<ITransport> transport_;
    std::optional<int> pid_;
    CapabilityNegotiator negotiator_;
    TimerQueue::TimerId settle_timer_ = TimerQueue::INVALID_TIMER;
    TimerQueue::TimerId negotiation_timer_ = TimerQueue::INVALID_TIMER;
    std::optional<CapabilityManifest> manifest_;
    std::optional<CapabilityManifest> cached_manifest_;
    std::optional<std::string> last_error_;

    Clock::time_point connected_at_;
    Clock::time_point last_traffic_at_;
    std::optional<Clock::time_point> last_heartbeat_at_;
    std::optional<int64_t> connected_at_ms_;
    std::optional<int64_t> last_response_ms_;
    std::optional<int64_t> last_heartbeat_ms_;

    std::deque<StatusEvent> events_;
    bool dispatching_ = false;
};

} // namespace mcphost
