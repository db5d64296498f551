#include <gtest/gtest.h>
#include "mcphost/health_monitor.hpp"
#include "support/fake_transport.hpp"
#include <atomic>
#include <mutex>
#include <unistd.h>

using namespace mcphost;
using mcphost::test::wait_until;
using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

namespace {

RegistryOptions fast_options() {
    RegistryOptions opts;
    opts.health_interval = milliseconds(20);
    opts.heartbeat_timeout = milliseconds(100);
    opts.stale_sweep_interval = milliseconds(30);
    opts.stale_threshold = milliseconds(60);
    return opts;
}

HealthSample connected_sample(int pid) {
    HealthSample s;
    s.status = ServerStatus::Connected;
    s.pid = pid;
    s.connected_at = Clock::now();
    s.last_traffic_at = Clock::now();
    return s;
}

} // anonymous namespace

// ---- Pure checks ----

TEST(HealthCheck, HealthyConnectedServer) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return true; });
    EXPECT_FALSE(m.check(connected_sample(10), Clock::now()).has_value());
}

TEST(HealthCheck, NotConnectedIsNeverChecked) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return false; });
    auto s = connected_sample(10);
    s.status = ServerStatus::Connecting;
    EXPECT_FALSE(m.check(s, Clock::now()).has_value());
}

TEST(HealthCheck, DeadProcessFails) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return false; });
    auto reason = m.check(connected_sample(10), Clock::now());
    ASSERT_TRUE(reason.has_value());
    EXPECT_NE(reason->find("10"), std::string::npos);
}

TEST(HealthCheck, MissingPidFails) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return true; });
    auto s = connected_sample(10);
    s.pid.reset();
    EXPECT_TRUE(m.check(s, Clock::now()).has_value());
}

TEST(HealthCheck, HeartbeatTimeoutCountsFromConnectWhenNoneSeen) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return true; });
    auto s = connected_sample(10);
    s.heartbeat_enabled = true;
    EXPECT_FALSE(m.check(s, s.connected_at + milliseconds(50)).has_value());
    EXPECT_TRUE(m.check(s, s.connected_at + milliseconds(150)).has_value());
}

TEST(HealthCheck, RecentHeartbeatKeepsServerHealthy) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return true; });
    auto s = connected_sample(10);
    s.heartbeat_enabled = true;
    s.last_heartbeat_at = s.connected_at + milliseconds(120);
    EXPECT_FALSE(m.check(s, s.connected_at + milliseconds(150)).has_value());
}

TEST(HealthCheck, HeartbeatIgnoredWhenDisabled) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return true; });
    auto s = connected_sample(10);
    EXPECT_FALSE(m.check(s, s.connected_at + milliseconds(10000)).has_value());
}

TEST(HealthCheck, Staleness) {
    HealthMonitor m(std::make_shared<TimerQueue>(), fast_options(), [](int) { return true; });
    auto s = connected_sample(10);
    EXPECT_FALSE(m.is_stale(s, s.last_traffic_at + milliseconds(30)));
    EXPECT_TRUE(m.is_stale(s, s.last_traffic_at + milliseconds(60)));
    s.status = ServerStatus::Disconnected;
    EXPECT_FALSE(m.is_stale(s, s.last_traffic_at + milliseconds(600)));
}

TEST(HealthCheck, ProcessAliveProbe) {
    EXPECT_TRUE(HealthMonitor::process_alive(static_cast<int>(::getpid())));
    EXPECT_FALSE(HealthMonitor::process_alive(0));
    EXPECT_FALSE(HealthMonitor::process_alive(-5));
}

// ---- Scheduling ----

TEST(HealthMonitor, ReportsFailureOffTimerThread) {
    auto timers = std::make_shared<TimerQueue>();
    std::atomic<bool> alive{true};
    auto m = std::make_shared<HealthMonitor>(timers, fast_options(), [&](int) { return alive.load(); });

    std::mutex mu;
    std::vector<std::string> reasons;
    HealthMonitor::Target t;
    t.sample = [] { return std::optional<HealthSample>(connected_sample(77)); };
    t.on_failure = [&](const std::string& r) {
        std::lock_guard<std::mutex> l(mu);
        reasons.push_back(r);
    };
    m->watch("alpha", t);

    std::this_thread::sleep_for(milliseconds(60));
    {
        std::lock_guard<std::mutex> l(mu);
        EXPECT_TRUE(reasons.empty());
    }

    alive = false;
    ASSERT_TRUE(wait_until([&] { std::lock_guard<std::mutex> l(mu); return !reasons.empty(); }));
    m->shutdown();
    std::lock_guard<std::mutex> l(mu);
    EXPECT_NE(reasons[0].find("77"), std::string::npos);
}

TEST(HealthMonitor, UnwatchStopsProbing) {
    auto timers = std::make_shared<TimerQueue>();
    std::atomic<int> samples{0};
    auto m = std::make_shared<HealthMonitor>(timers, fast_options(), [](int) { return true; });

    HealthMonitor::Target t;
    t.sample = [&] {
        ++samples;
        return std::optional<HealthSample>();
    };
    m->watch("alpha", t);
    ASSERT_TRUE(wait_until([&] { return samples.load() >= 2; }));
    m->unwatch("alpha");
    std::this_thread::sleep_for(milliseconds(30));
    int after = samples.load();
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_EQ(samples.load(), after);
}

TEST(HealthMonitor, StaleServerRestartedOnce) {
    auto timers = std::make_shared<TimerQueue>();
    auto m = std::make_shared<HealthMonitor>(timers, fast_options(), [](int) { return true; });

    auto quiet = connected_sample(5);
    quiet.last_traffic_at = Clock::now() - milliseconds(1000);

    std::atomic<int> restarts{0};
    std::atomic<bool> release{false};
    HealthMonitor::Target t;
    t.sample = [&] { return std::optional<HealthSample>(quiet); };
    t.on_stale = [&] {
        ++restarts;
        // a slow restart must not be started again by the next sweep
        while (!release) std::this_thread::sleep_for(milliseconds(5));
    };
    m->watch("alpha", t);
    m->start();

    ASSERT_TRUE(wait_until([&] { return restarts.load() == 1; }));
    std::this_thread::sleep_for(milliseconds(120));
    EXPECT_EQ(restarts.load(), 1);
    release = true;
    m->shutdown();
}

TEST(HealthMonitor, ShutdownIsIdempotentAndStopsWatching) {
    auto timers = std::make_shared<TimerQueue>();
    std::atomic<int> samples{0};
    auto m = std::make_shared<HealthMonitor>(timers, fast_options(), [](int) { return true; });
    m->start();
    m->shutdown();
    m->shutdown();

    HealthMonitor::Target t;
    t.sample = [&] {
        ++samples;
        return std::optional<HealthSample>();
    };
    m->watch("alpha", t);
    std::this_thread::sleep_for(milliseconds(60));
    EXPECT_EQ(samples.load(), 0);
}
