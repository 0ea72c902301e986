#include <benchmark/benchmark.h>
#include "wsrpc/codec.hpp"
#include "wsrpc/engine.hpp"
#include "wsrpc/log.hpp"
#include "wsrpc/pending_operations.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace wsrpc;

namespace {

class CountingTransport : public ITransport {
public:
    void send_message(const nlohmann::json& message, const CallContext&) override {
        ++sent;
        benchmark::DoNotOptimize(message);
    }

    std::size_t sent = 0;
};

struct Fixture {
    boost::asio::io_context io;
    CountingTransport transport;
    std::unique_ptr<Engine> engine;

    explicit Fixture(int n_methods) {
        Engine::Options opts;
        opts.enable_auto_cleanup = false;
        engine = std::make_unique<Engine>(io, transport, opts, EngineEvents{}, log::null_logger());
        for (int i = 0; i < n_methods; ++i) {
            engine->register_method("method_" + std::to_string(i),
                [](const nlohmann::json&, const CallContext&) {
                    return nlohmann::json{{"result", "ok"}};
                });
        }
        engine->register_method("ping", [](const nlohmann::json&, const CallContext&) {
            return nlohmann::json("pong");
        });
        engine->register_method("user.updated", [](const nlohmann::json&, const CallContext&) {
            return nlohmann::json();
        });
    }
};

} // namespace

static void BM_DispatchKnownMethod(benchmark::State& state) {
    Fixture f(1);
    auto validation = Codec::validate(Codec::parse_json(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));

    for (auto _ : state) {
        f.engine->dispatch(validation);
    }
    benchmark::DoNotOptimize(f.transport.sent);
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    Fixture f(1);
    auto validation = Codec::validate(
        Codec::parse_json(R"({"jsonrpc":"2.0","id":1,"method":"not_registered_method"})"));

    for (auto _ : state) {
        f.engine->dispatch(validation);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    Fixture f(100);

    std::vector<ValidationResult> requests;
    for (int i = 0; i < 100; ++i) {
        nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", i}, {"method", "method_" + std::to_string(i)}};
        requests.push_back(Codec::validate(req));
    }

    int i = 0;
    for (auto _ : state) {
        f.engine->dispatch(requests[i % 100]);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    Fixture f(0);
    auto validation = Codec::validate(
        Codec::parse_json(R"({"jsonrpc":"2.0","method":"user.updated","params":{"id":1}})"));

    for (auto _ : state) {
        f.engine->dispatch(validation);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);

static void BM_ValidateAndDispatchBatch(benchmark::State& state) {
    Fixture f(0);
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < 10; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}});
    }
    std::string raw = batch.dump();

    for (auto _ : state) {
        f.engine->validate_message(raw);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ValidateAndDispatchBatch)->MinTime(1.0);

static void BM_CallAndResolve(benchmark::State& state) {
    Fixture f(0);
    int64_t next = 0;

    for (auto _ : state) {
        CallOptions opts;
        opts.custom_id = RequestId{next};
        auto call = f.engine->handle_request("remote.ping", std::nullopt, opts);
        nlohmann::json response = {{"jsonrpc", "2.0"}, {"result", "pong"}, {"id", next}};
        f.engine->dispatch(Codec::validate(response));
        benchmark::DoNotOptimize(call.future.get());
        ++next;
    }
}
BENCHMARK(BM_CallAndResolve)->MinTime(1.0);

static void BM_PendingAddResolve(benchmark::State& state) {
    boost::asio::io_context io;
    PendingOperations::Options opts;
    opts.enable_auto_cleanup = false;
    PromiseOperations ops(io, opts, {}, log::null_logger());

    for (auto _ : state) {
        auto added = ops.add();
        ops.resolve(added.id, 1);
        benchmark::DoNotOptimize(added.future.get());
    }
}
BENCHMARK(BM_PendingAddResolve)->MinTime(1.0);
