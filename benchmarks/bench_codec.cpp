#include <benchmark/benchmark.h>
#include "mcpstub/codec.hpp"
#include "mcpstub/error.hpp"
#include <string>

using namespace mcpstub;

static const std::string kPingRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"text":"The quick brown fox jumps over the lazy dog"}}})";

static std::string make_large_request(size_t text_size) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"method", "tools/call"},
        {"params", {{"name", "reverse"}, {"arguments", {{"text", std::string(text_size, 'x')}}}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(64 * 1024);

// ---- Parse benchmarks ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kPingRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kPingRequest.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kLargeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseLargeRequest)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Encode benchmarks ----

static void BM_EncodeSuccess(benchmark::State& state) {
    auto resp = Response::success(3, {{"content", {{{"type", "text"}, {"text", "hello"}}}}});
    for (auto _ : state) {
        auto s = Codec::encode(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeSuccess)->MinTime(1.0);

static void BM_EncodeError(benchmark::State& state) {
    auto resp = Response::failure(9, -32601, "Method not found: resources/list");
    for (auto _ : state) {
        auto s = Codec::encode(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeError)->MinTime(1.0);
