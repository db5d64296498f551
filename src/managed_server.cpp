#include "mcphost/managed_server.hpp"
#include "mcphost/error.hpp"
#include <spdlog/spdlog.h>

namespace mcphost {

ManagedServer::ManagedServer(std::string id, ServerConfig config, RegistryOptions opts,
                             TransportFactory factory, std::shared_ptr<TimerQueue> timers,
                             StatusSink on_status, MessageSink on_message)
    : id_(std::move(id)),
      opts_(std::move(opts)),
      factory_(std::move(factory)),
      timers_(std::move(timers)),
      on_status_(std::move(on_status)),
      on_message_(std::move(on_message)),
      correlator_(std::make_shared<RequestCorrelator>(id_, timers_)),
      config_(std::move(config)),
      negotiator_(id_) {}

ManagedServer::~ManagedServer() {
    std::shared_ptr<ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_timers_locked();
        transport = std::move(transport_);
    }
    correlator_->reject_all(std::make_exception_ptr(
        DisposedError("Server " + id_ + " is disposing.")));
    if (transport) transport->dispose(std::chrono::milliseconds(0));
}

// ---------- Lifecycle ----------

void ManagedServer::start() {
    // Both outlive the lifecycle lock, see stop().
    std::shared_ptr<ITransport> previous;
    std::shared_ptr<ITransport> transport;
    std::lock_guard<std::recursive_mutex> life(lifecycle_mutex_);

    ServerConfig config;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            throw DisposedError("Server " + id_ + " has been disposed");
        }
        if (status_ == ServerStatus::Connecting || status_ == ServerStatus::Connected
            || status_ == ServerStatus::Stopping) {
            spdlog::warn("[Server] [{}] start() ignored, server is {}", id_, to_string(status_));
            return;
        }
        previous = detach_connection_locked();
        generation = ++generation_;
        config = config_;
        set_status_locked(ServerStatus::Connecting);
    }
    flush_events();
    if (previous) previous->dispose(opts_.dispose_grace);

    try {
        transport = factory_(id_);
        transport->start(config, make_handlers(generation));
    } catch (const std::exception& e) {
        spdlog::error("[Server] [{}] Failed to start: {}", id_, e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                ++generation_;
                set_status_locked(ServerStatus::Error, std::string(e.what()));
            }
        }
        flush_events();
        throw;
    }

    bool abandoned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || status_ != ServerStatus::Connecting) {
            // The process died (or wrote to stderr) before we got here.
            abandoned = true;
        } else {
            transport_ = transport;
            pid_ = transport->pid();
            last_traffic_at_ = Clock::now();
            settle_timer_ = timers_->schedule(opts_.settle_delay,
                [weak = weak_from_this(), generation]() {
                    if (auto self = weak.lock()) self->begin_negotiation(generation);
                });
            spdlog::debug("[Server] [{}] Spawned pid {}, settling for {} ms", id_,
                          pid_.value_or(-1), opts_.settle_delay.count());
        }
    }
    if (abandoned) transport->dispose(opts_.dispose_grace);
    flush_events();
}

void ManagedServer::stop() {
    // Released after the lifecycle lock: dropping the last reference joins the
    // reader thread, whose listeners may be waiting for that lock.
    std::shared_ptr<ITransport> transport;
    std::lock_guard<std::recursive_mutex> life(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ServerStatus::Disconnected || status_ == ServerStatus::Stopping) return;
        ++generation_;
        if (status_ == ServerStatus::Error) {
            transport = detach_connection_locked();
            set_status_locked(ServerStatus::Disconnected);
        } else {
            // Stopping still reports the live process.
            set_status_locked(ServerStatus::Stopping);
            transport = detach_connection_locked();
        }
    }
    correlator_->reject_all(std::make_exception_ptr(
        DisposedError("Server " + id_ + " is stopping.")));
    flush_events();

    if (transport) transport->dispose(opts_.stop_grace);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ServerStatus::Stopping) set_status_locked(ServerStatus::Disconnected);
    }
    flush_events();
}

void ManagedServer::mark_disconnected(const std::string& reason) {
    std::shared_ptr<ITransport> transport;
    std::lock_guard<std::recursive_mutex> life(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != ServerStatus::Connected) return;
        ++generation_;
        transport = detach_connection_locked();
        set_status_locked(ServerStatus::Disconnected, reason);
    }
    spdlog::warn("[Server] [{}] Disconnected: {}", id_, reason);
    correlator_->reject_all(std::make_exception_ptr(
        LivenessFailure("Server " + id_ + " failed a health check: " + reason)));
    flush_events();
    if (transport) transport->dispose(opts_.dispose_grace);
}

void ManagedServer::dispose(const std::string& reason) {
    std::shared_ptr<ITransport> transport;
    std::lock_guard<std::recursive_mutex> life(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) return;
        disposed_ = true;
        ++generation_;
        transport = detach_connection_locked();
        set_status_locked(ServerStatus::Disconnected, reason);
    }
    correlator_->reject_all(std::make_exception_ptr(
        DisposedError("Server " + id_ + " is disposing.")));
    flush_events();
    if (transport) transport->dispose(opts_.dispose_grace);
}

void ManagedServer::fail(uint64_t generation, const std::string& reason,
                         std::exception_ptr pending_error) {
    std::shared_ptr<ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        if (status_ != ServerStatus::Connecting && status_ != ServerStatus::Connected) return;
        ++generation_;
        transport = detach_connection_locked();
        set_status_locked(ServerStatus::Error, reason);
    }
    spdlog::error("[Server] [{}] {}", id_, reason);
    correlator_->reject_all(pending_error);
    flush_events();
    if (transport) transport->dispose(opts_.dispose_grace);
}

// ---------- Capability negotiation ----------

void ManagedServer::begin_negotiation(uint64_t generation) {
    std::shared_ptr<ITransport> transport;
    RequestMessage req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settle_timer_ = TimerQueue::INVALID_TIMER;
        if (generation != generation_ || status_ != ServerStatus::Connecting || !transport_) {
            spdlog::debug("[Server] [{}] Skipping negotiation, server is {}", id_,
                          to_string(status_));
            return;
        }
        req = negotiator_.begin();
        transport = transport_;
        negotiation_timer_ = timers_->schedule(opts_.negotiation_timeout,
            [weak = weak_from_this(), generation, request_id = negotiator_.request_id()]() {
                if (auto self = weak.lock()) self->negotiation_expired(generation, request_id);
            });
    }
    send_capability_request(generation, transport, req);
}

void ManagedServer::refresh_capabilities() {
    std::shared_ptr<ITransport> transport;
    RequestMessage req;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != ServerStatus::Connected) {
            throw NotConnectedError("Server " + id_ + " is not connected (status: " +
                                    to_string(status_) + ")");
        }
        if (negotiator_.active()) {
            spdlog::debug("[Server] [{}] Capability refresh already in progress", id_);
            return;
        }
        generation = generation_;
        req = negotiator_.begin();
        transport = transport_;
        negotiation_timer_ = timers_->schedule(opts_.negotiation_timeout,
            [weak = weak_from_this(), generation, request_id = negotiator_.request_id()]() {
                if (auto self = weak.lock()) self->negotiation_expired(generation, request_id);
            });
    }
    send_capability_request(generation, transport, req);
}

void ManagedServer::send_capability_request(uint64_t generation,
                                            const std::shared_ptr<ITransport>& transport,
                                            const RequestMessage& req) {
    try {
        transport->send(req);
    } catch (const WriteError& e) {
        fail(generation, std::string("Failed to send capability request: ") + e.what(),
             std::make_exception_ptr(e));
    }
}

void ManagedServer::negotiation_expired(uint64_t generation, const std::string& request_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        negotiation_timer_ = TimerQueue::INVALID_TIMER;
        auto res = negotiator_.expire(request_id);
        if (!res) return;
        apply_resolution_locked(std::move(*res));
    }
    flush_events();
}

void ManagedServer::apply_resolution_locked(CapabilityNegotiator::Resolution res) {
    if (status_ == ServerStatus::Connecting) {
        manifest_ = std::move(res.manifest);
        cached_manifest_ = manifest_;
        connected_at_ = last_traffic_at_ = Clock::now();
        connected_at_ms_ = now_ms();
        set_status_locked(ServerStatus::Connected);
        spdlog::info("[Server] [{}] Connected{}", id_, res.degraded ? " (no capabilities)" : "");
    } else if (status_ == ServerStatus::Connected) {
        // A failed refresh keeps what the server told us last time.
        if (!res.degraded || !manifest_) manifest_ = std::move(res.manifest);
        cached_manifest_ = manifest_;
        set_status_locked(ServerStatus::Connected);
    }
}

// ---------- Transport events ----------

TransportHandlers ManagedServer::make_handlers(uint64_t generation) {
    TransportHandlers h;
    auto weak = weak_from_this();
    h.on_message = [weak, generation](InboundMessage msg) {
        if (auto self = weak.lock()) self->handle_message(generation, std::move(msg));
    };
    h.on_parse_error = [weak](const std::string& line, const std::string& reason) {
        if (auto self = weak.lock()) {
            spdlog::debug("[Server] [{}] Ignoring bad line ({}): {}", self->id_, reason, line);
        }
    };
    h.on_diagnostic = [weak, generation](const std::string& line) {
        if (auto self = weak.lock()) self->handle_diagnostic(generation, line);
    };
    h.on_exit = [weak, generation](const ExitStatus& st) {
        if (auto self = weak.lock()) self->handle_exit(generation, st);
    };
    return h;
}

void ManagedServer::handle_message(uint64_t generation, InboundMessage msg) {
    // Replies to outstanding calls go straight to the correlator.
    if (auto* resp = std::get_if<ResponseMessage>(&msg)) {
        if (correlator_->handle_response(*resp)) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                last_traffic_at_ = Clock::now();
                last_response_ms_ = now_ms();
            }
            return;
        }
    }

    bool forward = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;

        last_traffic_at_ = Clock::now();
        last_response_ms_ = now_ms();
        if (auto* hb = std::get_if<HeartbeatMessage>(&msg)) {
            last_heartbeat_at_ = last_traffic_at_;
            last_heartbeat_ms_ = last_response_ms_;
            if (manifest_ && !hb->models.empty()) manifest_->models = hb->models;
        }

        if (negotiator_.active()) {
            if (auto res = negotiator_.offer(msg)) {
                timers_->cancel(negotiation_timer_);
                negotiation_timer_ = TimerQueue::INVALID_TIMER;
                forward = !res->consumed_message;
                apply_resolution_locked(std::move(*res));
            }
        }
    }
    flush_events();

    if (!forward) return;
    if (std::holds_alternative<CapabilityResponseMessage>(msg)) {
        spdlog::debug("[Server] [{}] Capability response arrived outside negotiation", id_);
    } else if (std::holds_alternative<ResponseMessage>(msg)) {
        spdlog::debug("[Server] [{}] Response for unknown request {}", id_,
                      id_to_key(std::get<ResponseMessage>(msg).id));
    }
    if (on_message_) on_message_(id_, msg);
}

void ManagedServer::handle_diagnostic(uint64_t generation, const std::string& line) {
    if (!opts_.fail_on_startup_stderr) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || status_ != ServerStatus::Connecting) return;
    }
    auto reason = "Server wrote to stderr during startup: " + line;
    fail(generation, reason, std::make_exception_ptr(ProcessExitError(reason)));
}

void ManagedServer::handle_exit(uint64_t generation, const ExitStatus& st) {
    auto reason = "Process " + st.describe();
    fail(generation, reason,
         std::make_exception_ptr(ProcessExitError("Server " + id_ + ": " + reason)));
}

// ---------- Calls ----------

std::future<nlohmann::json> ManagedServer::call(const std::string& method, nlohmann::json params,
                                                std::optional<std::chrono::milliseconds> timeout) {
    std::shared_ptr<ITransport> transport;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != ServerStatus::Connected || !transport_) {
            throw NotConnectedError("Server " + id_ + " is not connected (status: " +
                                    to_string(status_) + ")");
        }
        transport = transport_;
        generation = generation_;
    }

    std::optional<std::string> write_error;
    RequestId request_id;
    auto fut = correlator_->call(method, std::move(params),
                                 timeout.value_or(opts_.request_timeout),
                                 [&](const RequestMessage& req) {
        request_id = req.id;
        if (!is_current(generation)) return;
        try {
            transport->send(req);
        } catch (const WriteError& e) {
            write_error = e.what();
            throw;
        }
    });

    if (write_error) {
        fail(generation, "Write failed: " + *write_error,
             std::make_exception_ptr(WriteError(*write_error)));
    } else if (!is_current(generation)) {
        // The connection was torn down while this entry was being registered,
        // after its reject_all() had already run.
        correlator_->reject(request_id, std::make_exception_ptr(DisposedError(
            "Server " + id_ + " disconnected before the request was sent.")));
    }
    return fut;
}

bool ManagedServer::is_current(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation == generation_ && status_ == ServerStatus::Connected;
}

// ---------- State ----------

void ManagedServer::set_status_locked(ServerStatus s, std::optional<std::string> error) {
    auto previous = status_;
    status_ = s;
    last_error_ = s == ServerStatus::Error ? error : std::nullopt;

    StatusEvent ev;
    ev.server_id = id_;
    ev.status = s;
    ev.error = std::move(error);
    ev.pid = pid_;
    if (manifest_) {
        ev.models = manifest_->models;
        ev.capabilities = manifest_->capabilities;
    }
    events_.push_back(std::move(ev));

    if (previous != s) {
        spdlog::info("[Server] [{}] {} -> {}", id_, to_string(previous), to_string(s));
    }
}

void ManagedServer::cancel_timers_locked() {
    timers_->cancel(settle_timer_);
    timers_->cancel(negotiation_timer_);
    settle_timer_ = TimerQueue::INVALID_TIMER;
    negotiation_timer_ = TimerQueue::INVALID_TIMER;
}

std::shared_ptr<ITransport> ManagedServer::detach_connection_locked() {
    cancel_timers_locked();
    negotiator_.cancel();
    manifest_.reset();
    pid_.reset();
    last_heartbeat_at_.reset();
    return std::move(transport_);
}

void ManagedServer::flush_events() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dispatching_) return;   // the active dispatcher will deliver ours too
        dispatching_ = true;
    }
    while (true) {
        StatusEvent ev;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (events_.empty()) {
                dispatching_ = false;
                return;
            }
            ev = std::move(events_.front());
            events_.pop_front();
        }
        if (!on_status_) continue;
        try {
            on_status_(ev);
        } catch (const std::exception& e) {
            spdlog::error("[Server] [{}] Status sink threw: {}", id_, e.what());
        }
    }
}

void ManagedServer::set_config(ServerConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
}

ServerConfig ManagedServer::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

ServerStatus ManagedServer::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::size_t ManagedServer::pending_count() const {
    return correlator_->pending_count();
}

ServerSnapshot ManagedServer::snapshot() const {
    ServerSnapshot snap;
    snap.pending_requests = correlator_->pending_count();

    std::lock_guard<std::mutex> lock(mutex_);
    snap.server_id = id_;
    snap.status = status_;
    snap.manifest_is_live = manifest_.has_value();
    snap.manifest = manifest_ ? manifest_ : cached_manifest_;
    snap.last_error = last_error_;
    snap.pid = pid_;
    if (status_ == ServerStatus::Connected) {
        snap.connected_at = connected_at_ms_;
        snap.last_heartbeat_at = last_heartbeat_ms_;
    }
    snap.last_response_at = last_response_ms_;
    return snap;
}

std::optional<HealthSample> ManagedServer::health_sample() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ServerStatus::Connected) return std::nullopt;

    HealthSample sample;
    sample.status = status_;
    sample.pid = pid_;
    sample.heartbeat_enabled = config_.heartbeat_enabled;
    sample.connected_at = connected_at_;
    sample.last_heartbeat_at = last_heartbeat_at_;
    sample.last_traffic_at = last_traffic_at_;
    return sample;
}

} // namespace mcphost
