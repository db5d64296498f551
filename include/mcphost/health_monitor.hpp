#pragma once
#include "config.hpp"
#include "timer_queue.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

/// What the monitor needs to know about a server on each probe.
struct HealthSample {
    using TimePoint = std::chrono::steady_clock::time_point;

    ServerStatus status = ServerStatus::Disconnected;
    std::optional<int> pid;
    bool heartbeat_enabled = false;
    TimePoint connected_at;
    std::optional<TimePoint> last_heartbeat_at;
    TimePoint last_traffic_at;
};

/// Periodic liveness and heartbeat checks for connected servers, plus a slow
/// sweep for servers that are alive but have gone quiet.
///
/// Failures are reported through the target's callbacks on a background
/// task, never on the timer thread, since handling them kills processes.
class HealthMonitor : public std::enable_shared_from_this<HealthMonitor> {
public:
    using Probe = std::function<bool(int pid)>;

    struct Target {
        std::function<std::optional<HealthSample>()> sample;
        std::function<void(const std::string& reason)> on_failure;
        std::function<void()> on_stale;
    };

    HealthMonitor(std::shared_ptr<TimerQueue> timers, const RegistryOptions& opts,
                  Probe probe = nullptr);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Arm the stale-server sweep.
    void start();

    void watch(const std::string& id, Target target);
    void unwatch(const std::string& id);

    /// Cancel every timer and wait for running background tasks.
    void shutdown();

    /// Failure reason for `sample`, or nullopt if it is healthy.
    [[nodiscard]] std::optional<std::string> check(const HealthSample& sample,
                                                   HealthSample::TimePoint now) const;

    [[nodiscard]] bool is_stale(const HealthSample& sample, HealthSample::TimePoint now) const;

    /// kill(pid, 0)
    [[nodiscard]] static bool process_alive(int pid);

private:
    struct Watch {
        Target target;
        TimerQueue::TimerId timer = TimerQueue::INVALID_TIMER;
        uint64_t generation = 0;
        bool restarting = false;
    };

    void arm(const std::string& id, uint64_t generation);
    void tick(const std::string& id, uint64_t generation);
    void sweep();
    void run_in_background(std::function<void()> task);

    std::shared_ptr<TimerQueue> timers_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds heartbeat_timeout_;
    std::chrono::milliseconds sweep_interval_;
    std::chrono::milliseconds stale_threshold_;
    Probe probe_;

    std::mutex mutex_;
    bool stopped_ = false;
    uint64_t next_generation_ = 1;
    std::map<std::string, Watch> watches_;
    TimerQueue::TimerId sweep_timer_ = TimerQueue::INVALID_TIMER;
    std::vector<std::future<void>> background_;
};

} // namespace mcphost
