#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace mcphost {

/// One background thread that runs callbacks after a delay.
///
/// Every timeout and interval in the library goes through a TimerQueue, so
/// callbacks must be short: anything that blocks belongs on another thread.
/// Callbacks run without the queue's lock held and may schedule or cancel
/// other timers. Exceptions escaping a callback are logged and dropped.
class TimerQueue {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    static constexpr TimerId INVALID_TIMER = 0;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Callback cb);

    /// Returns true if the timer was still waiting and will not run.
    bool cancel(TimerId id);

    /// Drop all waiting timers and stop the thread. Later schedules are ignored.
    void shutdown();

    [[nodiscard]] std::size_t pending() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
    std::thread thread_;
};

} // namespace mcphost
