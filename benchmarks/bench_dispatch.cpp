#include <benchmark/benchmark.h>
#include "mcpstub/codec.hpp"
#include "mcpstub/dispatcher.hpp"
#include "mcpstub/log.hpp"
#include "mcpstub/server.hpp"
#include "mcpstub/tools/builtin.hpp"

using namespace mcpstub;

namespace {

Server::Options quiet_options() {
    log::set_level("off");
    Server::Options opts;
    opts.random_seed = 1;
    return opts;
}

Request request(const std::string& method, nlohmann::json params = nlohmann::json::object()) {
    Request req;
    req.jsonrpc = "2.0";
    req.id = RequestId{int64_t(1)};
    req.method = method;
    req.params = std::move(params);
    return req;
}

} // anonymous namespace

static void BM_DispatchPing(benchmark::State& state) {
    Server server{quiet_options()};
    auto req = request("ping");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing);

static void BM_DispatchToolsList(benchmark::State& state) {
    Server server{quiet_options()};
    auto req = request("tools/list");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList);

static void BM_DispatchToolCall(benchmark::State& state) {
    Server server{quiet_options()};
    static const char* const kCalls[][2] = {
        {"echo", R"({"text":"hello"})"},
        {"add", R"({"a":2,"b":3})"},
        {"get_time", "{}"},
        {"random", R"({"max":10})"},
        {"reverse", R"({"text":"hello"})"},
    };
    const auto& call = kCalls[state.range(0)];
    auto req = request("tools/call", {{"name", call[0]}, {"arguments", nlohmann::json::parse(call[1])}});
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
    state.SetLabel(call[0]);
}
BENCHMARK(BM_DispatchToolCall)->DenseRange(0, 4);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    Server server{quiet_options()};
    auto req = request("resources/list");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod);

// Full line round trip: decode, dispatch, encode.
static void BM_HandleLine(benchmark::State& state) {
    Server server{quiet_options()};
    const std::string line =
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"add","arguments":{"a":40,"b":2}}})";
    for (auto _ : state) {
        auto out = server.handle_line(line);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * line.size());
}
BENCHMARK(BM_HandleLine);
