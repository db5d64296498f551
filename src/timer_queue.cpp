#include "mcphost/timer_queue.hpp"
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace mcphost {

using Clock = std::chrono::steady_clock;

struct TimerQueue::Impl {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopping = false;
    TimerId next_id = 1;
    std::set<std::pair<Clock::time_point, TimerId>> order;
    std::map<TimerId, std::pair<Clock::time_point, Callback>> timers;

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            if (order.empty()) {
                cv.wait(lock, [this] { return stopping || !order.empty(); });
                continue;
            }
            auto first = *order.begin();
            if (Clock::now() < first.first) {
                cv.wait_until(lock, first.first);
                continue;
            }

            order.erase(order.begin());
            auto it = timers.find(first.second);
            if (it == timers.end()) continue;
            Callback cb = std::move(it->second.second);
            timers.erase(it);

            lock.unlock();
            try {
                cb();
            } catch (const std::exception& e) {
                spdlog::error("[Timer] Callback threw: {}", e.what());
            }
            cb = nullptr;   // release captures before retaking the lock
            lock.lock();
        }
    }
};

TimerQueue::TimerQueue()
    : impl_(std::make_shared<Impl>()) {
    // The thread keeps the state alive on its own, so a queue destroyed from
    // inside one of its callbacks can detach instead of joining itself.
    thread_ = std::thread([impl = impl_]() { impl->run(); });
}

TimerQueue::~TimerQueue() {
    shutdown();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Callback cb) {
    auto deadline = Clock::now() + delay;
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return INVALID_TIMER;
        id = impl_->next_id++;
        impl_->order.emplace(deadline, id);
        impl_->timers.emplace(id, std::make_pair(deadline, std::move(cb)));
    }
    impl_->cv.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    if (id == INVALID_TIMER) return false;
    Callback dropped;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->timers.find(id);
        if (it == impl_->timers.end()) return false;
        impl_->order.erase({it->second.first, id});
        dropped = std::move(it->second.second);
        impl_->timers.erase(it);
    }
    return true;
}

void TimerQueue::shutdown() {
    std::map<TimerId, std::pair<Clock::time_point, Callback>> dropped;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;
        impl_->stopping = true;
        impl_->order.clear();
        dropped.swap(impl_->timers);
    }
    impl_->cv.notify_all();
}

std::size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->timers.size();
}

} // namespace mcphost
