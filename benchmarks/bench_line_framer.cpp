#include <benchmark/benchmark.h>
#include "mcphost/line_framer.hpp"
#include <string>

using namespace mcphost;

// 1000 response lines in one buffer
static std::string make_stream(int lines) {
    std::string out;
    for (int i = 0; i < lines; ++i) {
        out += R"({"jsonrpc":"2.0","id":"req-)" + std::to_string(i) + R"(","result":{"hits":[]}})";
        out += (i % 3 == 0) ? "\r\n" : "\n";
    }
    return out;
}

static const std::string kStream = make_stream(1000);

static void BM_FrameChunked(benchmark::State& state) {
    const auto chunk = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        LineFramer framer;
        size_t total = 0;
        for (size_t pos = 0; pos < kStream.size(); pos += chunk) {
            auto lines = framer.append(std::string_view(kStream).substr(pos, chunk));
            total += lines.size();
        }
        benchmark::DoNotOptimize(total);
    }
    state.SetBytesProcessed(state.iterations() * kStream.size());
}
BENCHMARK(BM_FrameChunked)->Arg(64)->Arg(4096)->Arg(65536)->MinTime(1.0);
