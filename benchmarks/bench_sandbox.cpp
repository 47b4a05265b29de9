#include <benchmark/benchmark.h>
#include "mcpfs/log.hpp"
#include "mcpfs/sandbox.hpp"
#include "bench_fixture.hpp"
#include <filesystem>
#include <memory>
#include <string>

using namespace mcpfs;

struct SandboxFixture {
    BenchDir dir;
    std::string root;
    std::unique_ptr<PathSandbox> sandbox;

    SandboxFixture() {
        // Rejections log at WARN
        log::set_level(log::Level::Error);
        root = dir.path() + "/root";
        dir.write("root/a/b/c/d/file.txt", "x");
        dir.write("outside/secret.txt", "x");
        std::filesystem::create_symlink(dir.path() + "/outside", root + "/escape");
        sandbox = std::make_unique<PathSandbox>(std::vector<std::string>{root}, dir.path());
    }
};

static void BM_CleanPath(benchmark::State& state) {
    const std::string messy = "/srv//data/./a/b/../c/./d/../../e/file.txt";
    for (auto _ : state) {
        auto p = clean_path(messy);
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(BM_CleanPath);

static void BM_ResolveExisting(benchmark::State& state) {
    SandboxFixture fx;
    const std::string path = fx.root + "/a/b/c/d/file.txt";
    for (auto _ : state) {
        auto r = fx.sandbox->resolve(path);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ResolveExisting)->MinTime(1.0);

static void BM_ResolveNewFile(benchmark::State& state) {
    SandboxFixture fx;
    const std::string path = fx.root + "/a/b/c/d/new.txt";
    for (auto _ : state) {
        auto r = fx.sandbox->resolve(path);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ResolveNewFile)->MinTime(1.0);

static void BM_ResolveMissingParents(benchmark::State& state) {
    SandboxFixture fx;
    const std::string path = fx.root + "/a/x/y/z/new.txt";
    for (auto _ : state) {
        auto r = fx.sandbox->resolve(path, MissingParents::Allow);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ResolveMissingParents)->MinTime(1.0);

static void BM_RejectLexical(benchmark::State& state) {
    SandboxFixture fx;
    const std::string path = fx.dir.path() + "/outside/secret.txt";
    for (auto _ : state) {
        auto r = fx.sandbox->resolve(path);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_RejectLexical)->MinTime(1.0);

static void BM_RejectSymlinkEscape(benchmark::State& state) {
    SandboxFixture fx;
    const std::string path = fx.root + "/escape/secret.txt";
    for (auto _ : state) {
        auto r = fx.sandbox->resolve(path);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_RejectSymlinkEscape)->MinTime(1.0);
