#include <gtest/gtest.h>
#include "mcphost/error.hpp"
#include "mcphost/registry.hpp"
#include "support/fake_transport.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcphost;
using mcphost::test::wait_until;
using std::chrono::milliseconds;

class RegistryTrafficTest : public ::testing::Test {
protected:
    RegistryOptions opts_;
    std::unique_ptr<ServerRegistry> registry_;

    std::mutex mutex_;
    std::vector<ServerMessage> forwarded_;

    void SetUp() override {
        opts_.settle_delay = milliseconds(20);
        opts_.negotiation_timeout = milliseconds(3000);
        opts_.request_timeout = milliseconds(3000);
        opts_.dispose_grace = milliseconds(500);
        opts_.stop_grace = milliseconds(500);
        opts_.restart_delay = milliseconds(10);
        opts_.health_checks = false;
    }

    void TearDown() override {
        if (registry_) registry_->dispose();
    }

    /// Registers a single echo server as "alpha" and waits for it to connect.
    ServerRegistry& connect(std::vector<std::string> args = {}, bool heartbeats = false) {
        registry_ = std::make_unique<ServerRegistry>(opts_);
        registry_->on_message([this](const ServerMessage& m) {
            std::lock_guard<std::mutex> lock(mutex_);
            forwarded_.push_back(m);
        });
        ServerConfig c;
        c.command = ECHO_TOOL_SERVER_PATH;
        c.args = std::move(args);
        c.shell = false;
        c.heartbeat_enabled = heartbeats;
        registry_->initialize({{"alpha", c}});
        registry_->start("alpha");
        EXPECT_TRUE(registry_->wait_until_ready("alpha", milliseconds(5000)));
        return *registry_;
    }

    template <typename T>
    std::vector<T> forwarded_of() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& m : forwarded_) {
            if (auto* typed = std::get_if<T>(&m.message)) out.push_back(*typed);
        }
        return out;
    }

    static void expect_pending_rejected_with_disposed(std::future<nlohmann::json>& f) {
        ASSERT_EQ(f.wait_for(milliseconds(3000)), std::future_status::ready);
        EXPECT_THROW(f.get(), DisposedError);
    }
};

// ---- Calls ----

TEST_F(RegistryTrafficTest, EchoReturnsParams) {
    auto& reg = connect();
    auto f = reg.call_method("alpha", "echo", {{"text", "hi"}, {"n", 3}});
    auto result = f.get();
    EXPECT_EQ(result["text"], "hi");
    EXPECT_EQ(result["n"], 3);

    auto snap = reg.get_status("alpha");
    EXPECT_TRUE(snap->last_response_at.has_value());
    EXPECT_EQ(snap->pending_requests, 0u);
}

TEST_F(RegistryTrafficTest, SearchReturnsHits) {
    auto& reg = connect();
    auto result = reg.call_method("alpha", "search", {{"query", "anything"}}).get();
    EXPECT_EQ(result, (nlohmann::json{{"hits", nlohmann::json::array()}}));
}

TEST_F(RegistryTrafficTest, RepliesMatchedOutOfOrder) {
    auto& reg = connect({"--reverse-batch=5"});
    std::vector<std::future<nlohmann::json>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(reg.call_method("alpha", "echo", {{"n", i}}));
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(futures[i].get()["n"], i);
    }
}

TEST_F(RegistryTrafficTest, ConcurrentCallersFromManyThreads) {
    auto& reg = connect();
    std::vector<std::thread> threads;
    std::atomic<int> matched{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 10; ++i) {
                int n = t * 100 + i;
                if (reg.call_method("alpha", "echo", {{"n", n}}).get()["n"] == n) ++matched;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(matched.load(), 40);
}

TEST_F(RegistryTrafficTest, ErrorReplyBecomesRpcError) {
    auto& reg = connect({"--error-on=search"});
    auto f = reg.call_method("alpha", "search", {{"query", "x"}});
    try {
        f.get();
        FAIL() << "expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code, -1);
        EXPECT_STREQ(e.what(), "search failed");
        ASSERT_TRUE(e.data.has_value());
        EXPECT_EQ((*e.data)["method"], "search");
    }
    EXPECT_EQ(reg.get_status("alpha")->status, ServerStatus::Connected);
}

TEST_F(RegistryTrafficTest, UnknownMethodIsMethodNotFound) {
    auto& reg = connect();
    auto f = reg.call_method("alpha", "does/not/exist");
    try {
        f.get();
        FAIL() << "expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code, error::MethodNotFound);
    }
}

TEST_F(RegistryTrafficTest, UnansweredCallTimesOut) {
    auto& reg = connect({"--ignore=hang"});
    auto f = reg.call_method("alpha", "hang", nlohmann::json::object(), milliseconds(100));
    ASSERT_EQ(f.wait_for(milliseconds(3000)), std::future_status::ready);
    EXPECT_THROW(f.get(), RequestTimeoutError);

    // the server itself is unaffected
    EXPECT_EQ(reg.get_status("alpha")->status, ServerStatus::Connected);
    EXPECT_EQ(reg.call_method("alpha", "ping").get(), nlohmann::json::object());
}

TEST_F(RegistryTrafficTest, SlowReplyWithinTimeout) {
    auto& reg = connect();
    auto f = reg.call_method("alpha", "sleep", {{"ms", 100}}, milliseconds(2000));
    EXPECT_EQ(f.get()["slept"], 100);
}

// ---- Not connected ----

TEST_F(RegistryTrafficTest, UnknownServerIsNotConnected) {
    auto& reg = connect();
    EXPECT_THROW((void)reg.call_method("nobody", "echo"), NotConnectedError);
    EXPECT_THROW(reg.refresh_capabilities("nobody"), NotConnectedError);
}

TEST_F(RegistryTrafficTest, StoppedServerIsNotConnected) {
    auto& reg = connect();
    reg.stop("alpha");
    EXPECT_THROW((void)reg.call_method("alpha", "echo"), NotConnectedError);
    EXPECT_THROW(reg.refresh_capabilities("alpha"), NotConnectedError);
}

// ---- Pending calls on teardown ----

TEST_F(RegistryTrafficTest, DisposeRejectsPendingCalls) {
    auto& reg = connect({"--ignore=hang"});
    std::vector<std::future<nlohmann::json>> futures;
    for (int i = 0; i < 3; ++i) futures.push_back(reg.call_method("alpha", "hang"));
    ASSERT_TRUE(wait_until([&] { return reg.get_status("alpha")->pending_requests == 3; }));

    reg.dispose();
    for (auto& f : futures) expect_pending_rejected_with_disposed(f);
}

TEST_F(RegistryTrafficTest, StopRejectsPendingCalls) {
    auto& reg = connect({"--ignore=hang"});
    std::vector<std::future<nlohmann::json>> futures;
    for (int i = 0; i < 3; ++i) futures.push_back(reg.call_method("alpha", "hang"));

    reg.stop("alpha");
    for (auto& f : futures) expect_pending_rejected_with_disposed(f);
    EXPECT_EQ(reg.get_status("alpha")->pending_requests, 0u);
}

TEST_F(RegistryTrafficTest, ProcessExitRejectsPendingCalls) {
    auto& reg = connect({"--ignore=hang", "--exit-on=crash", "--exit-code=4"});
    auto hanging = reg.call_method("alpha", "hang");
    auto crashing = reg.call_method("alpha", "crash");

    ASSERT_EQ(hanging.wait_for(milliseconds(3000)), std::future_status::ready);
    EXPECT_THROW(hanging.get(), ProcessExitError);
    ASSERT_EQ(crashing.wait_for(milliseconds(3000)), std::future_status::ready);
    EXPECT_THROW(crashing.get(), ProcessExitError);

    auto snap = reg.get_status("alpha");
    EXPECT_EQ(snap->status, ServerStatus::Error);
    EXPECT_EQ(snap->last_error, std::optional<std::string>("Process exited with code 4"));
}

// ---- Unclaimed traffic ----

TEST_F(RegistryTrafficTest, HeartbeatsForwardedAndRecorded) {
    auto& reg = connect({"--heartbeat-ms=30", "--models=hb"}, true);
    ASSERT_TRUE(wait_until([&] { return forwarded_of<HeartbeatMessage>().size() >= 2; }));
    EXPECT_EQ(forwarded_of<HeartbeatMessage>()[0].models, (std::vector<std::string>{"hb"}));

    auto snap = reg.get_status("alpha");
    EXPECT_EQ(snap->status, ServerStatus::Connected);
    EXPECT_TRUE(snap->last_heartbeat_at.has_value());
    EXPECT_EQ(snap->manifest->models, (std::vector<std::string>{"hb"}));
}

TEST_F(RegistryTrafficTest, CapabilityReplyNotForwarded) {
    connect();
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_TRUE(forwarded_of<ResponseMessage>().empty());
    EXPECT_TRUE(forwarded_of<CapabilityResponseMessage>().empty());
}

TEST_F(RegistryTrafficTest, UnrelatedFirstMessageForwarded) {
    auto& reg = connect({"--unrelated-first"});
    ASSERT_TRUE(wait_until([&] { return !forwarded_of<UnknownMessage>().empty(); }));
    EXPECT_EQ(forwarded_of<UnknownMessage>()[0].raw["method"], "notifications/message");

    // the handshake gave up, so the manifest stays empty
    auto snap = reg.get_status("alpha");
    EXPECT_EQ(snap->status, ServerStatus::Connected);
    EXPECT_TRUE(snap->manifest->models.empty());

    // the capability reply arriving after that is just unclaimed traffic
    ASSERT_TRUE(wait_until([&] { return !forwarded_of<ResponseMessage>().empty(); }));
    EXPECT_TRUE(reg.get_status("alpha")->manifest->models.empty());
}

TEST_F(RegistryTrafficTest, LateCapabilityReplyForwarded) {
    opts_.negotiation_timeout = milliseconds(100);
    auto& reg = connect({"--capability-delay-ms=400", "--models=late"});
    EXPECT_TRUE(reg.get_status("alpha")->manifest->models.empty());

    ASSERT_TRUE(wait_until([&] { return !forwarded_of<ResponseMessage>().empty(); }));
    auto late = forwarded_of<ResponseMessage>()[0];
    EXPECT_EQ(id_to_key(late.id).rfind("cap-", 0), 0u);
    EXPECT_TRUE(reg.get_status("alpha")->manifest->models.empty());
}

TEST_F(RegistryTrafficTest, ListenerRemovalStopsForwarding) {
    auto& reg = connect({"--heartbeat-ms=30"});
    std::atomic<int> seen{0};
    auto token = reg.on_message([&](const ServerMessage&) { ++seen; });
    ASSERT_TRUE(wait_until([&] { return seen.load() > 0; }));
    EXPECT_TRUE(reg.remove_message_listener(token));
    std::this_thread::sleep_for(milliseconds(50));
    int after = seen.load();
    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_EQ(seen.load(), after);
}

// ---- Capability refresh ----

TEST_F(RegistryTrafficTest, RefreshCapabilities) {
    auto& reg = connect({"--models=r1,r2"});
    reg.refresh_capabilities("alpha");
    ASSERT_TRUE(wait_until([&] { return reg.get_status("alpha")->pending_requests == 0; }));
    std::this_thread::sleep_for(milliseconds(100));

    auto snap = reg.get_status("alpha");
    EXPECT_EQ(snap->status, ServerStatus::Connected);
    EXPECT_TRUE(snap->manifest_is_live);
    EXPECT_EQ(snap->manifest->models, (std::vector<std::string>{"r1", "r2"}));
    EXPECT_TRUE(forwarded_of<ResponseMessage>().empty());
}

TEST_F(RegistryTrafficTest, AllStatusesListed) {
    auto& reg = connect();
    auto all = reg.get_all_statuses();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all.at("alpha").status, ServerStatus::Connected);
    EXPECT_EQ(all.at("alpha").server_id, "alpha");
}
