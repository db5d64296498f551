#include "mcphost/health_monitor.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <cerrno>

namespace mcphost {

namespace {

long long ms_between(HealthSample::TimePoint from, HealthSample::TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // anonymous namespace

HealthMonitor::HealthMonitor(std::shared_ptr<TimerQueue> timers, const RegistryOptions& opts,
                             Probe probe)
    : timers_(std::move(timers)),
      interval_(opts.health_interval),
      heartbeat_timeout_(opts.heartbeat_timeout),
      sweep_interval_(opts.stale_sweep_interval),
      stale_threshold_(opts.stale_threshold),
      probe_(std::move(probe)) {
    if (!probe_) probe_ = &HealthMonitor::process_alive;
}

HealthMonitor::~HealthMonitor() {
    shutdown();
}

bool HealthMonitor::process_alive(int pid) {
    if (pid <= 0) return false;
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

std::optional<std::string> HealthMonitor::check(const HealthSample& sample,
                                                HealthSample::TimePoint now) const {
    if (sample.status != ServerStatus::Connected) return std::nullopt;

    if (!sample.pid) {
        return std::string("Connected server has no process");
    }
    if (!probe_(*sample.pid)) {
        return "Process " + std::to_string(*sample.pid) + " is no longer running";
    }
    if (sample.heartbeat_enabled) {
        auto since = sample.last_heartbeat_at.value_or(sample.connected_at);
        auto silent = ms_between(since, now);
        if (silent >= heartbeat_timeout_.count()) {
            return "No heartbeat for " + std::to_string(silent) + " ms (limit " +
                   std::to_string(heartbeat_timeout_.count()) + " ms)";
        }
    }
    return std::nullopt;
}

bool HealthMonitor::is_stale(const HealthSample& sample, HealthSample::TimePoint now) const {
    return sample.status == ServerStatus::Connected
           && ms_between(sample.last_traffic_at, now) >= stale_threshold_.count();
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || sweep_timer_ != TimerQueue::INVALID_TIMER) return;
    sweep_timer_ = timers_->schedule(sweep_interval_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) self->sweep();
    });
}

void HealthMonitor::watch(const std::string& id, Target target) {
    TimerQueue::TimerId old_timer = TimerQueue::INVALID_TIMER;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        auto& w = watches_[id];
        old_timer = w.timer;
        w.target = std::move(target);
        w.generation = generation = next_generation_++;
        w.timer = TimerQueue::INVALID_TIMER;
    }
    timers_->cancel(old_timer);
    arm(id, generation);
}

void HealthMonitor::unwatch(const std::string& id) {
    TimerQueue::TimerId timer = TimerQueue::INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(id);
        if (it == watches_.end()) return;
        timer = it->second.timer;
        watches_.erase(it);
    }
    timers_->cancel(timer);
}

void HealthMonitor::arm(const std::string& id, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watches_.find(id);
    if (stopped_ || it == watches_.end() || it->second.generation != generation) return;
    it->second.timer = timers_->schedule(interval_, [weak = weak_from_this(), id, generation]() {
        if (auto self = weak.lock()) self->tick(id, generation);
    });
}

void HealthMonitor::tick(const std::string& id, uint64_t generation) {
    Target target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(id);
        if (stopped_ || it == watches_.end() || it->second.generation != generation) return;
        target = it->second.target;
    }

    auto sample = target.sample ? target.sample() : std::nullopt;
    if (sample) {
        if (auto reason = check(*sample, std::chrono::steady_clock::now())) {
            spdlog::warn("[Health] [{}] {}", id, *reason);
            run_in_background([on_failure = target.on_failure, reason = *reason]() {
                if (on_failure) on_failure(reason);
            });
        }
    }
    arm(id, generation);
}

void HealthMonitor::sweep() {
    std::vector<std::pair<std::string, Target>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        for (const auto& [id, w] : watches_) {
            if (!w.restarting) targets.emplace_back(id, w.target);
        }
    }

    auto now = std::chrono::steady_clock::now();
    for (auto& [id, target] : targets) {
        auto sample = target.sample ? target.sample() : std::nullopt;
        if (!sample || !is_stale(*sample, now)) continue;

        spdlog::warn("[Health] [{}] No traffic for {} ms, restarting", id,
                     ms_between(sample->last_traffic_at, now));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = watches_.find(id);
            if (it == watches_.end()) continue;
            it->second.restarting = true;
        }
        run_in_background([weak = weak_from_this(), id = id, on_stale = target.on_stale]() {
            if (on_stale) on_stale();
            if (auto self = weak.lock()) {
                std::lock_guard<std::mutex> lock(self->mutex_);
                auto it = self->watches_.find(id);
                if (it != self->watches_.end()) it->second.restarting = false;
            }
        });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return;
    sweep_timer_ = timers_->schedule(sweep_interval_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) self->sweep();
    });
}

void HealthMonitor::run_in_background(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return;

    // Drop finished tasks so the list only holds work still in flight.
    for (auto it = background_.begin(); it != background_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = background_.erase(it);
        } else {
            ++it;
        }
    }

    background_.push_back(std::async(std::launch::async, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[Health] Background task failed: {}", e.what());
        }
    }));
}

void HealthMonitor::shutdown() {
    std::vector<TimerQueue::TimerId> timers;
    std::vector<std::future<void>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        timers.push_back(sweep_timer_);
        for (const auto& [id, w] : watches_) timers.push_back(w.timer);
        watches_.clear();
        running.swap(background_);
    }
    for (auto t : timers) timers_->cancel(t);
    for (auto& f : running) f.wait();
}

} // namespace mcphost
