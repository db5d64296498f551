#include <benchmark/benchmark.h>
#include "mcphost/codec.hpp"
#include "mcphost/message.hpp"
#include "mcphost/types.hpp"
#include <string>

using namespace mcphost;

static const std::string kSmallResponse =
    R"({"jsonrpc":"2.0","id":"req-1","result":{"hits":[]}})";

static const std::string kHeartbeat =
    R"({"type":"heartbeat","models":["echo-1","echo-2"]})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":"req-42","method":"search","params":{"q":"weather in Warsaw","limit":10}})";

// Capability reply advertising N tools
static std::string make_capability_reply(int n) {
    nlohmann::json caps = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        caps.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", "cap-1"},
        {"result", {{"models", {"m1", "m2"}}, {"capabilities", caps}, {"contextTypes", {"text"}}}}
    };
    return resp.dump();
}

static const std::string kCapabilityReply = make_capability_reply(100);

static void BM_ParseSmallResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallResponse.size());
}
BENCHMARK(BM_ParseSmallResponse)->MinTime(1.0);

static void BM_ParseHeartbeat(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kHeartbeat);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kHeartbeat.size());
}
BENCHMARK(BM_ParseHeartbeat)->MinTime(1.0);

static void BM_ParseCapabilityReply(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kCapabilityReply);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCapabilityReply.size());
}
BENCHMARK(BM_ParseCapabilityReply)->MinTime(1.0);

static void BM_ManifestFromReply(benchmark::State& state) {
    auto msg = Codec::parse(kCapabilityReply);
    const auto& result = *std::get<ResponseMessage>(msg).result;
    for (auto _ : state) {
        auto manifest = CapabilityManifest::from_result(result);
        benchmark::DoNotOptimize(manifest);
    }
}
BENCHMARK(BM_ManifestFromReply)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

static void BM_SerializeRequest(benchmark::State& state) {
    RequestMessage req;
    req.id = std::string("req-1");
    req.method = "search";
    req.params = nlohmann::json{{"q", "a"}};

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeRequest)->MinTime(1.0);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        auto serialized = Codec::serialize(std::get<RequestMessage>(msg));
        benchmark::DoNotOptimize(serialized);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);
