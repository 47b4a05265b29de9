#include <benchmark/benchmark.h>
#include "mcpfs/codec.hpp"
#include "mcpfs/json_rpc.hpp"
#include "mcpfs/types.hpp"
#include <string>

using namespace mcpfs;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"mcp.call_tool","params":{"name":"edit_file","arguments":{"path":"/srv/data/notes.txt","edits":[{"oldText":"alpha","newText":"beta"}],"dryRun":true}}})";

// A read_file reply carrying `n` bytes of text
static JsonRpcResponse make_read_reply(size_t n) {
    std::string body;
    body.reserve(n);
    for (size_t i = 0; i < n; ++i) body.push_back(i % 64 == 63 ? '\n' : static_cast<char>('a' + i % 26));
    JsonRpcResponse resp;
    resp.id = int64_t{7};
    resp.result = nlohmann::json(CallToolResult::text(std::move(body)));
    return resp;
}

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeReadReply(benchmark::State& state) {
    auto resp = make_read_reply(static_cast<size_t>(state.range(0)));
    size_t bytes = 0;
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        bytes = s.size();
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_SerializeReadReply)->Arg(1 << 10)->Arg(1 << 16)->Arg(1 << 20);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        auto serialized = Codec::serialize(msg);
        benchmark::DoNotOptimize(serialized);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);
