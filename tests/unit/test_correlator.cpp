#include <gtest/gtest.h>
#include "mcphost/correlator.hpp"
#include "mcphost/error.hpp"
#include <vector>

using namespace mcphost;
using std::chrono::milliseconds;

class CorrelatorTest : public ::testing::Test {
protected:
    std::shared_ptr<TimerQueue> timers_ = std::make_shared<TimerQueue>();
    std::shared_ptr<RequestCorrelator> correlator_ =
        std::make_shared<RequestCorrelator>("alpha", timers_);
    std::vector<RequestMessage> sent_;

    RequestCorrelator::Sender sender() {
        return [this](const RequestMessage& req) { sent_.push_back(req); };
    }
};

TEST_F(CorrelatorTest, ResolvesMatchingReply) {
    auto fut = correlator_->call("search", {{"q", "a"}}, milliseconds(1000), sender());
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_[0].method, "search");
    EXPECT_EQ((*sent_[0].params)["q"], "a");
    EXPECT_EQ(correlator_->pending_count(), 1u);

    EXPECT_TRUE(correlator_->handle_response(
        ResponseMessage{sent_[0].id, nlohmann::json{{"hits", nlohmann::json::array()}}, std::nullopt}));
    EXPECT_EQ(fut.get()["hits"], nlohmann::json::array());
    EXPECT_EQ(correlator_->pending_count(), 0u);
    EXPECT_EQ(timers_->pending(), 0u);
}

TEST_F(CorrelatorTest, IdsAreUniqueAndPrefixed) {
    auto a = correlator_->call("x", nullptr, milliseconds(1000), sender());
    auto b = correlator_->call("x", nullptr, milliseconds(1000), sender());
    ASSERT_EQ(sent_.size(), 2u);
    auto ka = id_to_key(sent_[0].id);
    auto kb = id_to_key(sent_[1].id);
    EXPECT_NE(ka, kb);
    EXPECT_EQ(ka.rfind("req-", 0), 0u);
    EXPECT_TRUE(correlator_->is_pending(sent_[1].id));
}

TEST_F(CorrelatorTest, OutOfOrderReplies) {
    std::vector<std::future<nlohmann::json>> futs;
    for (int i = 0; i < 5; ++i) {
        futs.push_back(correlator_->call("echo", {{"n", i}}, milliseconds(1000), sender()));
    }
    for (int i = 4; i >= 0; --i) {
        ASSERT_TRUE(correlator_->handle_response(
            ResponseMessage{sent_[i].id, nlohmann::json{{"n", i}}, std::nullopt}));
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(futs[i].get()["n"], i);
    }
}

TEST_F(CorrelatorTest, IntegerReplyMatchesStringId) {
    auto c = std::make_shared<RequestCorrelator>("alpha", timers_, "");
    auto fut = c->call("ping", nullptr, milliseconds(1000), sender());
    ASSERT_EQ(id_to_key(sent_[0].id), "1");
    EXPECT_TRUE(c->handle_response(ResponseMessage{int64_t{1}, nlohmann::json::object(), std::nullopt}));
    EXPECT_TRUE(fut.get().is_object());
}

TEST_F(CorrelatorTest, ErrorReplyRejectsWithRpcError) {
    auto fut = correlator_->call("search", nullptr, milliseconds(1000), sender());
    correlator_->handle_response(ResponseMessage{
        sent_[0].id, std::nullopt, RpcErrorInfo{-1, "search failed", nlohmann::json{{"k", 1}}}});
    try {
        fut.get();
        FAIL() << "expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code, -1);
        EXPECT_STREQ(e.what(), "search failed");
        ASSERT_TRUE(e.data.has_value());
        EXPECT_EQ((*e.data)["k"], 1);
    }
}

TEST_F(CorrelatorTest, UnknownReplyIgnored) {
    auto fut = correlator_->call("search", nullptr, milliseconds(1000), sender());
    EXPECT_FALSE(correlator_->handle_response(
        ResponseMessage{std::string("req-999"), nlohmann::json::object(), std::nullopt}));
    EXPECT_EQ(correlator_->pending_count(), 1u);
}

TEST_F(CorrelatorTest, SecondReplyForSameIdIgnored) {
    auto fut = correlator_->call("search", nullptr, milliseconds(1000), sender());
    EXPECT_TRUE(correlator_->handle_response(ResponseMessage{sent_[0].id, 1, std::nullopt}));
    EXPECT_FALSE(correlator_->handle_response(ResponseMessage{sent_[0].id, 2, std::nullopt}));
    EXPECT_EQ(fut.get(), 1);
}

TEST_F(CorrelatorTest, TimesOut) {
    auto fut = correlator_->call("slow", nullptr, milliseconds(30), sender());
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(fut.get(), RequestTimeoutError);
    EXPECT_EQ(correlator_->pending_count(), 0u);

    // a reply after the timeout finds nothing
    EXPECT_FALSE(correlator_->handle_response(ResponseMessage{sent_[0].id, 1, std::nullopt}));
}

TEST_F(CorrelatorTest, WriteFailureRejectsAndClears) {
    auto fut = correlator_->call("search", nullptr, milliseconds(1000),
                                 [](const RequestMessage&) { throw WriteError("EPIPE"); });
    EXPECT_THROW(fut.get(), WriteError);
    EXPECT_EQ(correlator_->pending_count(), 0u);
    EXPECT_EQ(timers_->pending(), 0u);
}

TEST_F(CorrelatorTest, RejectAllFailsEveryPending) {
    auto a = correlator_->call("a", nullptr, milliseconds(1000), sender());
    auto b = correlator_->call("b", nullptr, milliseconds(1000), sender());
    auto c = correlator_->call("c", nullptr, milliseconds(1000), sender());

    auto n = correlator_->reject_all(std::make_exception_ptr(DisposedError("Server alpha is disposing.")));
    EXPECT_EQ(n, 3u);
    EXPECT_THROW(a.get(), DisposedError);
    EXPECT_THROW(b.get(), DisposedError);
    EXPECT_THROW(c.get(), DisposedError);
    EXPECT_EQ(correlator_->pending_count(), 0u);
    EXPECT_EQ(timers_->pending(), 0u);
    EXPECT_EQ(correlator_->reject_all(std::make_exception_ptr(DisposedError("again"))), 0u);
}

TEST_F(CorrelatorTest, RejectOneLeavesOthersPending) {
    auto a = correlator_->call("a", nullptr, milliseconds(1000), sender());
    auto b = correlator_->call("b", nullptr, milliseconds(1000), sender());

    EXPECT_TRUE(correlator_->reject(sent_[0].id, std::make_exception_ptr(DisposedError("gone"))));
    EXPECT_THROW(a.get(), DisposedError);
    EXPECT_EQ(correlator_->pending_count(), 1u);
    EXPECT_TRUE(correlator_->is_pending(sent_[1].id));
    EXPECT_EQ(timers_->pending(), 1u);

    // already settled
    EXPECT_FALSE(correlator_->reject(sent_[0].id, std::make_exception_ptr(DisposedError("again"))));
}

TEST_F(CorrelatorTest, NullResultResolvesToNull) {
    auto fut = correlator_->call("x", nullptr, milliseconds(1000), sender());
    correlator_->handle_response(ResponseMessage{sent_[0].id, std::nullopt, std::nullopt});
    EXPECT_TRUE(fut.get().is_null());
}
