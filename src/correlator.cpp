#include "mcphost/correlator.hpp"
#include "mcphost/error.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace mcphost {

RequestCorrelator::RequestCorrelator(std::string server_id, std::shared_ptr<TimerQueue> timers,
                                     std::string id_prefix)
    : server_id_(std::move(server_id)),
      timers_(std::move(timers)),
      id_prefix_(std::move(id_prefix)) {}

std::future<nlohmann::json> RequestCorrelator::call(const std::string& method,
                                                    nlohmann::json params,
                                                    std::chrono::milliseconds timeout,
                                                    const Sender& send) {
    RequestMessage req;
    req.method = method;
    req.params = std::move(params);

    std::string key;
    std::future<nlohmann::json> fut;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        key = id_prefix_ + std::to_string(next_id_++);
        auto& entry = pending_[key];
        entry.method = method;
        entry.issued_at = std::chrono::steady_clock::now();
        fut = entry.promise.get_future();
        entry.timer = timers_->schedule(timeout, [weak = weak_from_this(), key]() {
            if (auto self = weak.lock()) self->expire(key);
        });
    }
    req.id = key;

    try {
        send(req);
    } catch (const WriteError&) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = pending_.find(key);
        if (it != pending_.end()) {
            auto entry = std::move(it->second);
            pending_.erase(it);
            lock.unlock();
            timers_->cancel(entry.timer);
            entry.promise.set_exception(std::current_exception());
        }
    }
    return fut;
}

bool RequestCorrelator::handle_response(const ResponseMessage& resp) {
    std::string key = id_to_key(resp.id);
    Pending entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(key);
        if (it == pending_.end()) return false;
        entry = std::move(it->second);
        pending_.erase(it);
    }
    timers_->cancel(entry.timer);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - entry.issued_at);
    if (resp.error) {
        spdlog::debug("[Correlator] [{}] {} ({}) failed after {} ms: {} {}", server_id_, key,
                      entry.method, elapsed.count(), resp.error->code, resp.error->message);
        entry.promise.set_exception(std::make_exception_ptr(
            RpcError(resp.error->code, resp.error->message, resp.error->data)));
    } else {
        spdlog::debug("[Correlator] [{}] {} ({}) answered in {} ms", server_id_, key,
                      entry.method, elapsed.count());
        entry.promise.set_value(resp.result ? *resp.result : nlohmann::json(nullptr));
    }
    return true;
}

void RequestCorrelator::expire(const std::string& key) {
    Pending entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(key);
        if (it == pending_.end()) return;
        entry = std::move(it->second);
        pending_.erase(it);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - entry.issued_at);
    spdlog::warn("[Correlator] [{}] {} ({}) timed out after {} ms", server_id_, key,
                 entry.method, elapsed.count());
    entry.promise.set_exception(std::make_exception_ptr(RequestTimeoutError(
        "Request " + key + " (" + entry.method + ") to " + server_id_ + " timed out after " +
        std::to_string(elapsed.count()) + " ms")));
}

bool RequestCorrelator::reject(const RequestId& id, const std::exception_ptr& reason) {
    Pending entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id_to_key(id));
        if (it == pending_.end()) return false;
        entry = std::move(it->second);
        pending_.erase(it);
    }
    timers_->cancel(entry.timer);
    entry.promise.set_exception(reason);
    return true;
}

std::size_t RequestCorrelator::reject_all(const std::exception_ptr& reason) {
    std::map<std::string, Pending> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    for (auto& [key, entry] : drained) {
        timers_->cancel(entry.timer);
        entry.promise.set_exception(reason);
    }
    if (!drained.empty()) {
        spdlog::debug("[Correlator] [{}] Rejected {} pending request(s)", server_id_, drained.size());
    }
    return drained.size();
}

std::size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RequestCorrelator::is_pending(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id_to_key(id)) > 0;
}

} // namespace mcphost
