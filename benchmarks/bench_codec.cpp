#include <benchmark/benchmark.h>
#include "wsrpc/codec.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/json_rpc.hpp"
#include <string>
#include <vector>

using namespace wsrpc;

// Small message (~60 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kUserGetRequest =
    R"({"jsonrpc":"2.0","id":"0b6f2a4e-7c1d-4f3a-9e8b-5d2c1a0f9e8d","method":"user.get","params":{"userId":123,"fields":["name","email","roles"]}})";

// Generate a user.list response with N users
static std::string make_large_response(int n) {
    nlohmann::json users = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        users.push_back({
            {"id", i},
            {"name", "user_" + std::to_string(i)},
            {"email", "user_" + std::to_string(i) + "@example.com"},
            {"roles", {"reader", "writer"}},
            {"active", i % 2 == 0}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"users", users}}}
    };
    return resp.dump();
}

static const std::string kLargeResponse = make_large_response(100);

static std::string make_batch(int n) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}, {"params", nlohmann::json::object()}});
    }
    return batch.dump();
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

static void BM_ParseUserGetRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kUserGetRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kUserGetRequest.size());
}
BENCHMARK(BM_ParseUserGetRequest)->MinTime(1.0);

static void BM_ParseLargeMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_ParseLargeMessage)->MinTime(1.0);

static void BM_ParseBatch(benchmark::State& state) {
    std::string raw = make_batch(50);

    for (auto _ : state) {
        auto msgs = Codec::parse_batch(raw);
        benchmark::DoNotOptimize(msgs);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseBatch)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Validation benchmarks ----

static void BM_ValidateRequest(benchmark::State& state) {
    auto j = Codec::parse_json(kUserGetRequest);
    for (auto _ : state) {
        auto result = Codec::validate(j);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ValidateRequest)->MinTime(1.0);

static void BM_ValidateBatch(benchmark::State& state) {
    auto j = Codec::parse_json(make_batch(10));
    for (auto _ : state) {
        auto result = Codec::validate(j);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ValidateBatch)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallMessage(benchmark::State& state) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";
    req.params = nlohmann::json::object();

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeSmallMessage)->MinTime(1.0);

static void BM_SerializeLargeMessage(benchmark::State& state) {
    auto msg = Codec::parse(kLargeResponse);

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_SerializeLargeMessage)->MinTime(1.0);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kUserGetRequest);
        auto serialized = Codec::serialize(msg);
        benchmark::DoNotOptimize(serialized);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);
