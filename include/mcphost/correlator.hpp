#pragma once
#include "message.hpp"
#include "timer_queue.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace mcphost {

/// Matches replies to outstanding requests by id.
///
/// Every pending entry owns a promise and exactly one timeout timer. An
/// entry leaves the table through exactly one of: its reply, its timer,
/// a failed write, or reject_all().
class RequestCorrelator : public std::enable_shared_from_this<RequestCorrelator> {
public:
    using Sender = std::function<void(const RequestMessage&)>;

    RequestCorrelator(std::string server_id, std::shared_ptr<TimerQueue> timers,
                      std::string id_prefix = "req-");

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// Register a request, hand it to `send`, and return its future.
    /// The future fails with WriteError if `send` throws one, with
    /// RequestTimeoutError after `timeout`, or with RpcError on an error reply.
    [[nodiscard]] std::future<nlohmann::json> call(const std::string& method,
                                                   nlohmann::json params,
                                                   std::chrono::milliseconds timeout,
                                                   const Sender& send);

    /// Settle the matching entry. Returns false if no entry has this id.
    bool handle_response(const ResponseMessage& resp);

    /// Fail one entry. Returns false if it already settled.
    bool reject(const RequestId& id, const std::exception_ptr& reason);

    /// Fail every pending entry with `reason`. Returns how many were rejected.
    std::size_t reject_all(const std::exception_ptr& reason);

    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] bool is_pending(const RequestId& id) const;

private:
    struct Pending {
        std::promise<nlohmann::json> promise;
        TimerQueue::TimerId timer = TimerQueue::INVALID_TIMER;
        std::string method;
        std::chrono::steady_clock::time_point issued_at;
    };

    void expire(const std::string& key);

    std::string server_id_;
    std::shared_ptr<TimerQueue> timers_;
    std::string id_prefix_;

    mutable std::mutex mutex_;
    std::map<std::string, Pending> pending_;
    uint64_t next_id_{1};
};

} // namespace mcphost
