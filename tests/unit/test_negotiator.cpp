#include <gtest/gtest.h>
#include "mcphost/error.hpp"
#include "mcphost/negotiator.hpp"
#include "mcphost/version.hpp"

using namespace mcphost;

namespace {

nlohmann::json capability_result() {
    return {{"models", {"m1", "m2"}},
            {"capabilities", {{{"name", "search"}}}},
            {"contextTypes", {"text"}}};
}

} // anonymous namespace

TEST(Negotiator, BeginBuildsCapabilityRequest) {
    CapabilityNegotiator n("alpha");
    EXPECT_FALSE(n.active());

    auto req = n.begin();
    EXPECT_TRUE(n.active());
    EXPECT_EQ(req.method, std::string(CAPABILITY_METHOD));
    EXPECT_EQ(id_to_key(req.id), n.request_id());
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ((*req.params)["client"]["name"], std::string(CLIENT_NAME));
    EXPECT_EQ((*req.params)["client"]["version"], std::string(LIBRARY_VERSION));
}

TEST(Negotiator, EachRoundGetsFreshId) {
    CapabilityNegotiator n("alpha");
    auto first = n.begin();
    n.cancel();
    auto second = n.begin();
    EXPECT_NE(id_to_key(first.id), id_to_key(second.id));
}

TEST(Negotiator, ReplyToRequestIdResolves) {
    CapabilityNegotiator n("alpha");
    auto req = n.begin();
    auto res = n.offer(ResponseMessage{req.id, capability_result(), std::nullopt});
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->degraded);
    EXPECT_TRUE(res->consumed_message);
    EXPECT_EQ(res->manifest.models, (std::vector<std::string>{"m1", "m2"}));
    ASSERT_EQ(res->manifest.capabilities.size(), 1u);
    EXPECT_EQ(res->manifest.capabilities[0].name, "search");
    EXPECT_FALSE(n.active());
}

TEST(Negotiator, TypedReplyResolvesWithoutId) {
    CapabilityNegotiator n("alpha");
    (void)n.begin();
    CapabilityResponseMessage cap;
    cap.result = capability_result();
    auto res = n.offer(cap);
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->degraded);
    EXPECT_TRUE(res->consumed_message);
    EXPECT_EQ(res->manifest.models.size(), 2u);
}

TEST(Negotiator, HeartbeatKeepsWaiting) {
    CapabilityNegotiator n("alpha");
    (void)n.begin();
    EXPECT_FALSE(n.offer(HeartbeatMessage{{"m1"}, nlohmann::json::object()}).has_value());
    EXPECT_TRUE(n.active());
}

TEST(Negotiator, UnrelatedMessageDegradesWithoutConsuming) {
    CapabilityNegotiator n("alpha");
    (void)n.begin();
    auto res = n.offer(UnknownMessage{{{"type", "startup"}}});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->degraded);
    EXPECT_FALSE(res->consumed_message);
    EXPECT_TRUE(res->manifest.models.empty());
    EXPECT_EQ(res->manifest.context_types, (std::vector<std::string>{"text"}));
    EXPECT_FALSE(n.active());
}

TEST(Negotiator, ReplyToOtherIdIsUnrelated) {
    CapabilityNegotiator n("alpha");
    (void)n.begin();
    auto res = n.offer(ResponseMessage{std::string("req-5"), nlohmann::json::object(), std::nullopt});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->degraded);
    EXPECT_FALSE(res->consumed_message);
}

TEST(Negotiator, ErrorReplyDegrades) {
    CapabilityNegotiator n("alpha");
    auto req = n.begin();
    auto res = n.offer(ResponseMessage{req.id, std::nullopt,
                                       RpcErrorInfo{error::MethodNotFound, "nope", std::nullopt}});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->degraded);
    EXPECT_TRUE(res->consumed_message);
    EXPECT_NE(res->reason.find("nope"), std::string::npos);
}

TEST(Negotiator, NonObjectResultDegrades) {
    CapabilityNegotiator n("alpha");
    auto req = n.begin();
    auto res = n.offer(ResponseMessage{req.id, nlohmann::json("text"), std::nullopt});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->degraded);
    EXPECT_TRUE(res->consumed_message);
}

TEST(Negotiator, MalformedResultDegrades) {
    CapabilityNegotiator n("alpha");
    auto req = n.begin();
    nlohmann::json bad = {{"capabilities", {{{"name", 42}}}}};
    auto res = n.offer(ResponseMessage{req.id, bad, std::nullopt});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->degraded);
    EXPECT_TRUE(res->consumed_message);
}

TEST(Negotiator, ExpireForCurrentRound) {
    CapabilityNegotiator n("alpha");
    (void)n.begin();
    auto res = n.expire(n.request_id());
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->degraded);
    EXPECT_FALSE(res->consumed_message);
    EXPECT_FALSE(n.active());
}

TEST(Negotiator, StaleExpireIgnored) {
    CapabilityNegotiator n("alpha");
    (void)n.begin();
    auto old_id = n.request_id();
    n.cancel();
    (void)n.begin();
    EXPECT_FALSE(n.expire(old_id).has_value());
    EXPECT_TRUE(n.active());
}

TEST(Negotiator, IdleIgnoresEverything) {
    CapabilityNegotiator n("alpha");
    CapabilityResponseMessage cap;
    cap.result = capability_result();
    EXPECT_FALSE(n.offer(cap).has_value());

    auto req = n.begin();
    ASSERT_TRUE(n.offer(ResponseMessage{req.id, capability_result(), std::nullopt}).has_value());
    // round finished; a late duplicate changes nothing
    EXPECT_FALSE(n.offer(cap).has_value());
    EXPECT_FALSE(n.expire(n.request_id()).has_value());
}
