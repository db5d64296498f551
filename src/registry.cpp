#include "mcphost/registry.hpp"
#include "mcphost/backoff.hpp"
#include "mcphost/error.hpp"
#include "mcphost/transport/process_transport.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace mcphost {

ServerRegistry::ServerRegistry(RegistryOptions opts, TransportFactory factory, ConfigSource source)
    : opts_(std::move(opts)),
      factory_(factory ? std::move(factory) : ProcessTransport::factory()),
      source_(std::move(source)),
      timers_(std::make_shared<TimerQueue>()),
      status_channel_(std::make_shared<StatusChannel>("Status")),
      message_channel_(std::make_shared<MessageChannel>("Messages")),
      health_(std::make_shared<HealthMonitor>(timers_, opts_)) {
    if (opts_.health_checks) health_->start();
}

ServerRegistry::~ServerRegistry() {
    dispose();
}

// ---------- Configuration ----------

void ServerRegistry::initialize(const std::map<std::string, ServerConfig>& configs) {
    for (const auto& [id, config] : configs) {
        add_server(id, config);
    }
    spdlog::info("[Registry] Initialized with {} server(s)", configs.size());
}

void ServerRegistry::add_server(const std::string& id, ServerConfig config) {
    std::shared_ptr<ManagedServer> existing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) throw DisposedError("Registry has been disposed");
        auto it = servers_.find(id);
        if (it == servers_.end()) {
            create_locked(id, std::move(config));
            return;
        }
        existing = it->second;
    }
    existing->set_config(std::move(config));
    spdlog::debug("[Registry] [{}] Configuration updated", id);
}

std::shared_ptr<ManagedServer> ServerRegistry::create_locked(const std::string& id,
                                                             ServerConfig config) {
    std::weak_ptr<StatusChannel> status_channel = status_channel_;
    std::weak_ptr<MessageChannel> message_channel = message_channel_;

    auto server = std::make_shared<ManagedServer>(
        id, std::move(config), opts_, factory_, timers_,
        [status_channel](const StatusEvent& ev) {
            if (auto ch = status_channel.lock()) ch->publish(ev);
        },
        [message_channel](const std::string& server_id, const InboundMessage& msg) {
            if (auto ch = message_channel.lock()) ch->publish(ServerMessage{server_id, msg});
        });
    servers_.emplace(id, server);

    if (opts_.health_checks) {
        std::weak_ptr<ManagedServer> weak = server;
        auto restart_delay = opts_.restart_delay;
        auto ready_timeout = opts_.settle_delay + opts_.negotiation_timeout;
        auto backoff = opts_.ready_backoff;

        HealthMonitor::Target target;
        target.sample = [weak]() -> std::optional<HealthSample> {
            auto s = weak.lock();
            return s ? s->health_sample() : std::nullopt;
        };
        target.on_failure = [weak](const std::string& reason) {
            if (auto s = weak.lock()) s->mark_disconnected(reason);
        };
        target.on_stale = [weak, restart_delay, ready_timeout, backoff]() {
            auto s = weak.lock();
            if (!s) return;
            s->stop();
            std::this_thread::sleep_for(restart_delay);
            s->start();
            bool ready = ExponentialBackoff(backoff).poll(
                [&s] { return s->status() == ServerStatus::Connected; }, ready_timeout);
            if (!ready) {
                spdlog::warn("[Registry] [{}] Not ready after stale restart", s->id());
            }
        };
        health_->watch(id, std::move(target));
    }

    spdlog::debug("[Registry] [{}] Registered", id);
    return server;
}

bool ServerRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(id) > 0;
}

std::vector<std::string> ServerRegistry::server_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(servers_.size());
    for (const auto& entry : servers_) ids.push_back(entry.first);
    return ids;
}

std::shared_ptr<ManagedServer> ServerRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    return it == servers_.end() ? nullptr : it->second;
}

std::shared_ptr<ManagedServer> ServerRegistry::find_or_load(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) throw DisposedError("Registry has been disposed");
        auto it = servers_.find(id);
        if (it != servers_.end()) return it->second;
    }

    std::optional<ServerConfig> config = source_ ? source_(id) : std::nullopt;
    if (!config) {
        throw ConfigError("No configuration for server: " + id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) throw DisposedError("Registry has been disposed");
    auto it = servers_.find(id);
    if (it != servers_.end()) return it->second;
    return create_locked(id, normalize_server_config(std::move(*config)));
}

// ---------- Lifecycle ----------

void ServerRegistry::start(const std::string& id) {
    auto server = find_or_load(id);
    spdlog::info("[Registry] [{}] Starting", id);
    server->start();
}

void ServerRegistry::stop(const std::string& id) {
    auto server = find(id);
    if (!server) {
        spdlog::debug("[Registry] [{}] stop() for unknown server", id);
        return;
    }
    server->stop();
}

void ServerRegistry::restart(const std::string& id) {
    auto server = find_or_load(id);
    if (source_) {
        if (auto updated = source_(id)) server->set_config(normalize_server_config(std::move(*updated)));
    }
    spdlog::info("[Registry] [{}] Restarting", id);
    server->stop();
    std::this_thread::sleep_for(opts_.restart_delay);
    server->start();
}

void ServerRegistry::remove(const std::string& id) {
    std::shared_ptr<ManagedServer> server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(id);
        if (it == servers_.end()) return;
        server = std::move(it->second);
        servers_.erase(it);
    }
    health_->unwatch(id);
    server->dispose("Server " + id + " was removed");
    spdlog::info("[Registry] [{}] Removed", id);
}

void ServerRegistry::start_all() {
    for (const auto& id : server_ids()) {
        try {
            start(id);
        } catch (const HostError& e) {
            spdlog::error("[Registry] [{}] {}", id, e.what());
        }
    }
}

void ServerRegistry::stop_all() {
    for (const auto& id : server_ids()) {
        stop(id);
    }
}

bool ServerRegistry::wait_until_ready(const std::string& id, std::chrono::milliseconds timeout) {
    ExponentialBackoff backoff(opts_.ready_backoff);
    return backoff.poll([this, &id] {
        auto server = find(id);
        return server && server->status() == ServerStatus::Connected;
    }, timeout);
}

// ---------- Traffic ----------

std::future<nlohmann::json> ServerRegistry::call_method(const std::string& id,
                                                        const std::string& method,
                                                        nlohmann::json params,
                                                        std::optional<std::chrono::milliseconds> timeout) {
    auto server = find(id);
    if (!server) {
        throw NotConnectedError("Unknown server: " + id);
    }
    return server->call(method, std::move(params), timeout);
}

void ServerRegistry::refresh_capabilities(const std::string& id) {
    auto server = find(id);
    if (!server) {
        throw NotConnectedError("Unknown server: " + id);
    }
    server->refresh_capabilities();
}

// ---------- Status ----------

std::optional<ServerSnapshot> ServerRegistry::get_status(const std::string& id) const {
    auto server = find(id);
    if (!server) return std::nullopt;
    return server->snapshot();
}

std::map<std::string, ServerSnapshot> ServerRegistry::get_all_statuses() const {
    std::vector<std::shared_ptr<ManagedServer>> servers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : servers_) servers.push_back(entry.second);
    }
    std::map<std::string, ServerSnapshot> out;
    for (const auto& s : servers) {
        out.emplace(s->id(), s->snapshot());
    }
    return out;
}

StatusChannel::Token ServerRegistry::subscribe(StatusChannel::Listener listener) {
    return status_channel_->subscribe(std::move(listener));
}

bool ServerRegistry::unsubscribe(StatusChannel::Token token) {
    return status_channel_->unsubscribe(token);
}

MessageChannel::Token ServerRegistry::on_message(MessageChannel::Listener listener) {
    return message_channel_->subscribe(std::move(listener));
}

bool ServerRegistry::remove_message_listener(MessageChannel::Token token) {
    return message_channel_->unsubscribe(token);
}

void ServerRegistry::dispose() {
    std::map<std::string, std::shared_ptr<ManagedServer>> servers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) return;
        disposed_ = true;
        servers.swap(servers_);
    }
    spdlog::info("[Registry] Disposing {} server(s)", servers.size());

    health_->shutdown();
    for (auto& [id, server] : servers) {
        server->dispose("Registry disposed");
    }
    timers_->shutdown();
    status_channel_->clear();
    message_channel_->clear();
}

} // namespace mcphost
