#include <gtest/gtest.h>
#include "mcphost/timer_queue.hpp"
#include "support/fake_transport.hpp"
#include <atomic>
#include <mutex>
#include <vector>

using namespace mcphost;
using mcphost::test::wait_until;
using std::chrono::milliseconds;

TEST(TimerQueue, RunsAfterDelay) {
    TimerQueue q;
    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    std::atomic<long long> elapsed{0};
    q.schedule(milliseconds(30), [&] {
        elapsed = std::chrono::duration_cast<milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        fired = true;
    });
    ASSERT_TRUE(wait_until([&] { return fired.load(); }));
    EXPECT_GE(elapsed.load(), 30);
}

TEST(TimerQueue, FiresInDeadlineOrder) {
    TimerQueue q;
    std::mutex m;
    std::vector<int> order;
    q.schedule(milliseconds(60), [&] { std::lock_guard<std::mutex> l(m); order.push_back(3); });
    q.schedule(milliseconds(10), [&] { std::lock_guard<std::mutex> l(m); order.push_back(1); });
    q.schedule(milliseconds(30), [&] { std::lock_guard<std::mutex> l(m); order.push_back(2); });
    ASSERT_TRUE(wait_until([&] { std::lock_guard<std::mutex> l(m); return order.size() == 3; }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TimerQueue, CancelPreventsCallback) {
    TimerQueue q;
    std::atomic<bool> fired{false};
    auto id = q.schedule(milliseconds(50), [&] { fired = true; });
    EXPECT_TRUE(q.cancel(id));
    EXPECT_FALSE(q.cancel(id));
    EXPECT_EQ(q.pending(), 0u);
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_FALSE(fired);
}

TEST(TimerQueue, CancelInvalidIsNoop) {
    TimerQueue q;
    EXPECT_FALSE(q.cancel(TimerQueue::INVALID_TIMER));
}

TEST(TimerQueue, CallbackMayScheduleAnother) {
    TimerQueue q;
    std::atomic<bool> second{false};
    q.schedule(milliseconds(5), [&] {
        q.schedule(milliseconds(5), [&] { second = true; });
    });
    EXPECT_TRUE(wait_until([&] { return second.load(); }));
}

TEST(TimerQueue, ThrowingCallbackDoesNotStopQueue) {
    TimerQueue q;
    std::atomic<bool> after{false};
    q.schedule(milliseconds(5), [] { throw std::runtime_error("boom"); });
    q.schedule(milliseconds(20), [&] { after = true; });
    EXPECT_TRUE(wait_until([&] { return after.load(); }));
}

TEST(TimerQueue, ShutdownDropsPendingAndRejectsNew) {
    TimerQueue q;
    std::atomic<bool> fired{false};
    q.schedule(milliseconds(50), [&] { fired = true; });
    q.shutdown();
    EXPECT_EQ(q.pending(), 0u);
    EXPECT_EQ(q.schedule(milliseconds(1), [&] { fired = true; }), TimerQueue::INVALID_TIMER);
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_FALSE(fired);
}
