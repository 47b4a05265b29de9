#include <benchmark/benchmark.h>
#include "mcpfs/dispatcher.hpp"
#include "mcpfs/log.hpp"
#include "mcpfs/sandbox.hpp"
#include "mcpfs/tools.hpp"
#include "bench_fixture.hpp"
#include <memory>
#include <string>

using namespace mcpfs;

// The full tool catalogue over a small scratch tree
struct DispatchFixture {
    BenchDir dir;
    std::unique_ptr<PathSandbox> sandbox;
    ToolRegistry tools;
    std::unique_ptr<Dispatcher> dispatcher;

    DispatchFixture() {
        log::set_level(log::Level::Error);
        dir.write("notes.txt", std::string(4096, 'n'));
        for (int i = 0; i < 50; ++i) {
            dir.write("tree/d" + std::to_string(i % 5) + "/file" + std::to_string(i) + ".txt", "x");
        }
        sandbox = std::make_unique<PathSandbox>(std::vector<std::string>{dir.path()}, dir.path());
        register_filesystem_tools(tools, *sandbox);
        dispatcher = std::make_unique<Dispatcher>(tools);
    }

    std::string call(const std::string& tool, const nlohmann::json& args) const {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "mcp.call_tool"},
                              {"params", {{"name", tool}, {"arguments", args}}}}.dump();
    }
};

static void run_frame(benchmark::State& state, DispatchFixture& fx, const std::string& frame) {
    for (auto _ : state) {
        auto reply = fx.dispatcher->handle_frame(frame);
        benchmark::DoNotOptimize(reply);
    }
}

static void BM_DispatchPing(benchmark::State& state) {
    DispatchFixture fx;
    run_frame(state, fx, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
}
BENCHMARK(BM_DispatchPing)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    DispatchFixture fx;
    run_frame(state, fx, R"({"jsonrpc":"2.0","id":1,"method":"not_registered_method"})");
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchListTools(benchmark::State& state) {
    DispatchFixture fx;
    run_frame(state, fx, R"({"jsonrpc":"2.0","id":1,"method":"mcp.list_tools"})");
}
BENCHMARK(BM_DispatchListTools)->MinTime(1.0);

static void BM_DispatchReadFile(benchmark::State& state) {
    DispatchFixture fx;
    run_frame(state, fx, fx.call("read_file", {{"path", fx.dir.path() + "/notes.txt"}}));
}
BENCHMARK(BM_DispatchReadFile)->MinTime(1.0);

static void BM_DispatchDirectoryTree(benchmark::State& state) {
    DispatchFixture fx;
    run_frame(state, fx, fx.call("directory_tree", {{"path", fx.dir.path() + "/tree"}}));
}
BENCHMARK(BM_DispatchDirectoryTree)->MinTime(1.0);

static void BM_DispatchSearchFiles(benchmark::State& state) {
    DispatchFixture fx;
    run_frame(state, fx, fx.call("search_files", {{"path", fx.dir.path()}, {"pattern", "file4"}}));
}
BENCHMARK(BM_DispatchSearchFiles)->MinTime(1.0);
