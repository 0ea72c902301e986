#include <gtest/gtest.h>
#include "wsrpc/engine.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/log.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wsrpc;
using namespace std::chrono_literals;

namespace {

class RecordingTransport : public ITransport {
public:
    void send_message(const nlohmann::json& message, const CallContext& context) override {
        if (fail) {
            throw TransportError("connection lost");
        }
        sent.push_back(message);
        contexts.push_back(context);
    }

    std::vector<nlohmann::json> sent;
    std::vector<CallContext> contexts;
    bool fail = false;
};

Engine::Options quiet_options() {
    Engine::Options opts;
    opts.enable_auto_cleanup = false;
    return opts;
}

bool is_ready(std::future<nlohmann::json>& f) {
    return f.wait_for(0ms) == std::future_status::ready;
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    std::unique_ptr<Engine> make_engine(Engine::Options opts = quiet_options(),
                                        EngineEvents events = {}) {
        return std::make_unique<Engine>(io_, transport_, std::move(opts), std::move(events),
                                        log::null_logger());
    }

    void run_for(std::chrono::milliseconds d) {
        io_.restart();
        io_.run_for(d);
    }

    boost::asio::io_context io_;
    RecordingTransport transport_;
};

// ---- Inbound requests ----

TEST_F(EngineTest, EchoRequest) {
    auto engine = make_engine();
    engine->register_method("echo", [](const nlohmann::json& params, const CallContext&) {
        return params;
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"echo","params":{"x":1},"id":7})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    auto expected = nlohmann::json::parse(R"({"jsonrpc":"2.0","result":{"x":1},"id":7})");
    EXPECT_EQ(transport_.sent[0], expected);
}

TEST_F(EngineTest, StringIdIsEchoedAsString) {
    auto engine = make_engine();
    engine->register_method("user.get", [](const nlohmann::json& params, const CallContext&) {
        return nlohmann::json{{"id", params.at("userId")}, {"name", "Alice"}};
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"user.get","params":{"userId":123},"id":"7"})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_TRUE(transport_.sent[0]["id"].is_string());
    EXPECT_EQ(transport_.sent[0]["id"], "7");
    EXPECT_EQ(transport_.sent[0]["result"]["name"], "Alice");
}

TEST_F(EngineTest, MissingMethod) {
    std::vector<std::string> errors;
    EngineEvents events;
    events.on_method_error = [&](const std::string& method, const JsonRpcError& err,
                                 const CallContext&) {
        errors.push_back(method + ":" + std::to_string(err.code));
    };
    auto engine = make_engine(quiet_options(), events);

    engine->validate_message(R"({"jsonrpc":"2.0","method":"missing","id":1})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::MethodNotFound);
    EXPECT_EQ(transport_.sent[0]["id"], 1);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "missing:-32601");
}

TEST_F(EngineTest, MalformedJsonGetsParseError) {
    auto engine = make_engine();
    engine->validate_message("{not json");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::ParseError);
    EXPECT_TRUE(transport_.sent[0]["id"].is_null());
}

TEST_F(EngineTest, WrongVersionGetsInvalidRequest) {
    auto engine = make_engine();
    engine->validate_message(R"({"jsonrpc":"1.0","method":"echo","id":3})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::InvalidRequest);
    EXPECT_EQ(transport_.sent[0]["id"], 3);
}

TEST_F(EngineTest, ScalarMessageGetsInvalidRequest) {
    auto engine = make_engine();
    for (const char* raw : {"5", "true", R"("x")", "null"}) {
        transport_.sent.clear();
        engine->validate_message(raw);

        ASSERT_EQ(transport_.sent.size(), 1u) << raw;
        EXPECT_EQ(transport_.sent[0]["error"]["code"], error::InvalidRequest) << raw;
        EXPECT_TRUE(transport_.sent[0]["id"].is_null()) << raw;
    }
}

TEST_F(EngineTest, IdBeyondInt64GetsInvalidRequest) {
    auto engine = make_engine();
    bool called = false;
    engine->register_method("echo", [&](const nlohmann::json& params, const CallContext&) {
        called = true;
        return params;
    });

    engine->validate_message(
        R"({"jsonrpc":"2.0","method":"echo","params":{},"id":18446744073709551615})");

    EXPECT_FALSE(called);
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::InvalidRequest);
    EXPECT_TRUE(transport_.sent[0]["id"].is_null());
}

TEST_F(EngineTest, AbsentParamsArriveAsEmptyObject) {
    auto engine = make_engine();
    nlohmann::json seen;
    engine->register_method("ping", [&](const nlohmann::json& params, const CallContext&) {
        seen = params;
        return nlohmann::json("pong");
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"ping","id":1})");
    EXPECT_TRUE(seen.is_object());
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(transport_.sent.at(0)["result"], "pong");
}

TEST_F(EngineTest, NonStrictAcceptsScalarParams) {
    auto opts = quiet_options();
    opts.strict_validation = false;
    auto engine = make_engine(opts);
    engine->register_method("echo", [](const nlohmann::json& params, const CallContext&) {
        return params;
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"echo","params":"hi","id":1})");
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["result"], "hi");
}

TEST_F(EngineTest, HooksSeeTransportContext) {
    std::vector<std::string> calls;
    EngineEvents events;
    events.on_method_call = [&](const std::string& method, const nlohmann::json&,
                                const CallContext& ctx) {
        calls.push_back("call:" + method + ":" + ctx.transport.value("conn", ""));
    };
    events.on_method_response = [&](const std::string& method, const nlohmann::json& result,
                                    const CallContext&) {
        calls.push_back("response:" + method + ":" + result.dump());
    };
    auto engine = make_engine(quiet_options(), events);
    engine->register_method("sum", [](const nlohmann::json& p, const CallContext& ctx) {
        EXPECT_EQ(ctx.method, "sum");
        EXPECT_TRUE(ctx.id.has_value());
        return nlohmann::json(p.at(0).get<int>() + p.at(1).get<int>());
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"sum","params":[1,2],"id":1})",
                             nlohmann::json{{"conn", "c-9"}});

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "call:sum:c-9");
    EXPECT_EQ(calls[1], "response:sum:3");
    ASSERT_EQ(transport_.contexts.size(), 1u);
    EXPECT_EQ(transport_.contexts[0].transport["conn"], "c-9");
}

// ---- Handler failures ----

TEST_F(EngineTest, ProtocolErrorKeepsCodeAndData) {
    auto engine = make_engine();
    engine->register_method("user.get", [](const nlohmann::json&, const CallContext&) -> nlohmann::json {
        throw ProtocolError(error::InvalidParams, "userId is required",
                            nlohmann::json{{"field", "userId"}});
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"user.get","params":{},"id":1})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& err = transport_.sent[0]["error"];
    EXPECT_EQ(err["code"], error::InvalidParams);
    EXPECT_EQ(err["message"], "userId is required");
    EXPECT_EQ(err["data"]["field"], "userId");
}

TEST_F(EngineTest, GenericFailureBecomesInternalError) {
    auto engine = make_engine();
    engine->register_method("boom", [](const nlohmann::json&, const CallContext&) -> nlohmann::json {
        throw std::runtime_error("kaboom");
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"boom","id":1})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& err = transport_.sent[0]["error"];
    EXPECT_EQ(err["code"], error::InternalError);
    EXPECT_EQ(err["message"], "Internal error");
    EXPECT_EQ(err["data"]["errorType"], "kaboom");
}

TEST_F(EngineTest, DefaultErrorHandlerHeuristics) {
    CallContext ctx;
    auto timeout = Engine::default_error_handler(
        std::make_exception_ptr(std::runtime_error("upstream timeout reached")), ctx);
    EXPECT_EQ(timeout.code, error::TimeoutError);
    EXPECT_EQ(timeout.message, "Request timeout");

    auto connection = Engine::default_error_handler(
        std::make_exception_ptr(std::runtime_error("Database connection lost")), ctx);
    EXPECT_EQ(connection.code, error::ConnectionError);

    // The match is case-sensitive.
    auto capitalized = Engine::default_error_handler(
        std::make_exception_ptr(std::runtime_error("Timeout reached")), ctx);
    EXPECT_EQ(capitalized.code, error::InternalError);
    EXPECT_EQ((*capitalized.data)["errorType"], "Timeout reached");

    auto shouted = Engine::default_error_handler(
        std::make_exception_ptr(std::runtime_error("CONNECTION refused")), ctx);
    EXPECT_EQ(shouted.code, error::InternalError);

    auto coded = Engine::default_error_handler(
        std::make_exception_ptr(ProtocolError(error::RateLimitError, "slow down")), ctx);
    EXPECT_EQ(coded.code, error::RateLimitError);
    EXPECT_EQ(coded.message, "slow down");
    EXPECT_FALSE(coded.data.has_value());
}

TEST_F(EngineTest, CustomErrorHandler) {
    auto opts = quiet_options();
    opts.error_handler = [](std::exception_ptr, const CallContext& ctx) {
        return make_error(error::ValidationError, "rejected " + ctx.method);
    };
    auto engine = make_engine(opts);
    engine->register_method("check", [](const nlohmann::json&, const CallContext&) -> nlohmann::json {
        throw std::logic_error("nope");
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"check","id":"a"})");
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::ValidationError);
    EXPECT_EQ(transport_.sent[0]["error"]["message"], "rejected check");
}

TEST_F(EngineTest, MalformedResponseIsInternalError) {
    auto opts = quiet_options();
    opts.strict_validation = false;
    auto engine = make_engine(opts);

    engine->validate_message(R"({"jsonrpc":"2.0","id":1,"error":"boom"})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::InternalError);
    EXPECT_TRUE(transport_.sent[0]["id"].is_null());
}

// ---- Notifications ----

TEST_F(EngineTest, NotificationsNeverAnswer) {
    auto engine = make_engine();
    int updates = 0;
    engine->register_method("user.updated", [&](const nlohmann::json&, const CallContext& ctx) {
        EXPECT_FALSE(ctx.id.has_value());
        ++updates;
        return nlohmann::json();
    });
    engine->register_method("fails", [](const nlohmann::json&, const CallContext&) -> nlohmann::json {
        throw std::runtime_error("ignored");
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"user.updated","params":{"id":1}})");
    engine->validate_message(R"({"jsonrpc":"2.0","method":"fails"})");
    engine->validate_message(R"({"jsonrpc":"2.0","method":"unknown"})");

    EXPECT_EQ(updates, 1);
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(EngineTest, ThrowingCallHookStillAnswers) {
    EngineEvents events;
    events.on_method_call = [](const std::string&, const nlohmann::json&, const CallContext&) {
        throw std::runtime_error("audit sink down");
    };
    auto engine = make_engine(quiet_options(), events);
    engine->register_method("echo", [](const nlohmann::json& params, const CallContext&) {
        return params;
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"echo","params":{"x":1},"id":1})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["id"], 1);
    EXPECT_EQ(transport_.sent[0]["result"]["x"], 1);
    EXPECT_FALSE(transport_.sent[0].contains("error"));
}

TEST_F(EngineTest, ThrowingErrorHookStillAnswers) {
    EngineEvents events;
    events.on_method_error = [](const std::string&, const JsonRpcError&, const CallContext&) {
        throw std::runtime_error("audit sink down");
    };
    auto engine = make_engine(quiet_options(), events);

    engine->validate_message(R"({"jsonrpc":"2.0","method":"missing","id":4})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["id"], 4);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::MethodNotFound);
}

// ---- Async handlers ----

TEST_F(EngineTest, AsyncHandlerRepliesLater) {
    auto engine = make_engine();
    std::vector<MethodReply> replies;
    engine->register_async_method("slow", [&](const nlohmann::json&, const CallContext&,
                                              MethodReply reply) {
        replies.push_back(reply);
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"slow","id":1})");
    EXPECT_TRUE(transport_.sent.empty());
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_FALSE(replies[0].settled());

    replies[0].resolve("done");
    replies[0].resolve("again");
    replies[0].reject(std::make_exception_ptr(std::runtime_error("late")));

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["result"], "done");
    EXPECT_TRUE(replies[0].settled());
}

TEST_F(EngineTest, AsyncHandlerThrowBeforeReply) {
    auto engine = make_engine();
    engine->register_async_method("bad", [](const nlohmann::json&, const CallContext&, MethodReply) {
        throw ProtocolError(error::AuthorizationError, "forbidden");
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"bad","id":2})");
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::AuthorizationError);
}

TEST_F(EngineTest, ThrowingResponseHookStillSendsAsyncReply) {
    EngineEvents events;
    events.on_method_response = [](const std::string&, const nlohmann::json&,
                                   const CallContext&) {
        throw std::runtime_error("audit sink down");
    };
    auto engine = make_engine(quiet_options(), events);
    engine->register_async_method("quick", [](const nlohmann::json&, const CallContext&,
                                              MethodReply reply) {
        reply.resolve("done");
    });

    engine->validate_message(R"({"jsonrpc":"2.0","method":"quick","id":9})");

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["id"], 9);
    EXPECT_EQ(transport_.sent[0]["result"], "done");
}

TEST_F(EngineTest, AsyncReplyAfterDestroyIsDropped) {
    std::vector<MethodReply> replies;
    {
        auto engine = make_engine();
        engine->register_async_method("slow", [&](const nlohmann::json&, const CallContext&,
                                                  MethodReply reply) {
            replies.push_back(reply);
        });
        engine->validate_message(R"({"jsonrpc":"2.0","method":"slow","id":1})");
    }
    ASSERT_EQ(replies.size(), 1u);
    replies[0].resolve(1);
    EXPECT_TRUE(transport_.sent.empty());
}

// ---- Batches ----

TEST_F(EngineTest, BatchGathersRequestResultsInOrder) {
    auto engine = make_engine();
    engine->register_method("sum", [](const nlohmann::json& p, const CallContext&) {
        return nlohmann::json(p.at(0).get<int>() + p.at(1).get<int>());
    });
    engine->register_method("log", [](const nlohmann::json&, const CallContext&) {
        return nlohmann::json();
    });

    engine->validate_message(R"([
        {"jsonrpc":"2.0","method":"sum","params":[1,2],"id":"1"},
        {"jsonrpc":"2.0","method":"log","params":{"m":"hi"}},
        {"jsonrpc":"2.0","method":"missing","id":"2"}
    ])");

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& out = transport_.sent[0];
    ASSERT_TRUE(out.is_array());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0]["id"], "1");
    EXPECT_EQ(out[0]["result"], 3);
    EXPECT_EQ(out[1]["id"], "2");
    EXPECT_EQ(out[1]["error"]["code"], error::MethodNotFound);
}

TEST_F(EngineTest, ThrowingHookDoesNotAbortBatch) {
    EngineEvents events;
    events.on_method_call = [](const std::string& method, const nlohmann::json&,
                               const CallContext&) {
        if (method == "first") throw std::runtime_error("audit sink down");
    };
    auto engine = make_engine(quiet_options(), events);
    engine->register_method("first", [](const nlohmann::json&, const CallContext&) {
        return nlohmann::json(1);
    });
    engine->register_method("second", [](const nlohmann::json&, const CallContext&) {
        return nlohmann::json(2);
    });

    engine->validate_message(R"([
        {"jsonrpc":"2.0","method":"first","id":1},
        {"jsonrpc":"2.0","method":"second","id":2}
    ])");

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& out = transport_.sent[0];
    ASSERT_TRUE(out.is_array());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0]["id"], 1);
    EXPECT_EQ(out[0]["result"], 1);
    EXPECT_EQ(out[1]["id"], 2);
    EXPECT_EQ(out[1]["result"], 2);
}

TEST_F(EngineTest, BatchWaitsForSlowItems) {
    auto engine = make_engine();
    std::vector<MethodReply> replies;
    engine->register_async_method("slow", [&](const nlohmann::json&, const CallContext&,
                                              MethodReply reply) {
        replies.push_back(reply);
    });
    engine->register_method("fast", [](const nlohmann::json&, const CallContext&) {
        return nlohmann::json("fast");
    });

    engine->validate_message(R"([
        {"jsonrpc":"2.0","method":"slow","id":1},
        {"jsonrpc":"2.0","method":"fast","id":2}
    ])");
    EXPECT_TRUE(transport_.sent.empty());

    ASSERT_EQ(replies.size(), 1u);
    replies[0].resolve("slow");

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& out = transport_.sent[0];
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0]["result"], "slow");
    EXPECT_EQ(out[1]["result"], "fast");
}

TEST_F(EngineTest, NotificationOnlyBatchSendsNothing) {
    auto engine = make_engine();
    int seen = 0;
    engine->register_method("tick", [&](const nlohmann::json&, const CallContext&) {
        ++seen;
        return nlohmann::json();
    });

    engine->validate_message(R"([
        {"jsonrpc":"2.0","method":"tick"},
        {"jsonrpc":"2.0","method":"tick"}
    ])");
    EXPECT_EQ(seen, 2);
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(EngineTest, OversizedBatchGetsOneError) {
    auto opts = quiet_options();
    opts.max_batch_size = 10;
    auto engine = make_engine(opts);
    int calls = 0;
    engine->register_method("noop", [&](const nlohmann::json&, const CallContext&) {
        ++calls;
        return nlohmann::json();
    });

    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < 11; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"method", "noop"}, {"id", i}});
    }
    engine->validate_message(batch.dump());

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& out = transport_.sent[0];
    ASSERT_TRUE(out.is_object());
    EXPECT_EQ(out["error"]["code"], error::InvalidRequest);
    EXPECT_TRUE(out["id"].is_null());
    EXPECT_EQ(calls, 0);
}

TEST_F(EngineTest, EmptyBatchIsInvalid) {
    auto engine = make_engine();
    engine->validate_message("[]");
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["error"]["code"], error::InvalidRequest);
}

TEST_F(EngineTest, BatchResponsesAreCorrelated) {
    auto engine = make_engine();
    CallOptions a_opts;
    a_opts.custom_id = RequestId{int64_t{10}};
    CallOptions b_opts;
    b_opts.custom_id = RequestId{int64_t{11}};
    auto a = engine->handle_request("a", std::nullopt, a_opts);
    auto b = engine->handle_request("b", std::nullopt, b_opts);
    transport_.sent.clear();

    engine->validate_message(R"([
        {"jsonrpc":"2.0","result":"A","id":10},
        {"jsonrpc":"2.0","error":{"code":-32000,"message":"B failed"},"id":11}
    ])");

    EXPECT_TRUE(transport_.sent.empty());
    EXPECT_EQ(a.future.get(), "A");
    EXPECT_THROW(b.future.get(), ProtocolError);
}

// ---- Outbound calls ----

TEST_F(EngineTest, OutboundCallResolves) {
    auto engine = make_engine();
    auto call = engine->handle_request("math.add", nlohmann::json{{"a", 2}, {"b", 3}});

    ASSERT_EQ(transport_.sent.size(), 1u);
    const auto& req = transport_.sent[0];
    EXPECT_EQ(req["method"], "math.add");
    EXPECT_EQ(req["jsonrpc"], "2.0");
    ASSERT_TRUE(req["id"].is_string());
    EXPECT_EQ(req["id"], std::get<std::string>(call.request.id));

    nlohmann::json response = {{"jsonrpc", "2.0"}, {"result", 5}, {"id", req["id"]}};
    engine->validate_message(response.dump());

    ASSERT_TRUE(is_ready(call.future));
    EXPECT_EQ(call.future.get(), 5);
    EXPECT_EQ(engine->stats().pending_requests.total, 0u);
}

TEST_F(EngineTest, OutboundCallWithIntegerId) {
    auto engine = make_engine();
    CallOptions opts;
    opts.custom_id = RequestId{int64_t{5}};
    opts.context = nlohmann::json{{"conn", "c-1"}};
    auto call = engine->handle_request("ping", std::nullopt, opts);

    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0]["id"], 5);
    EXPECT_FALSE(transport_.sent[0].contains("params"));
    EXPECT_EQ(transport_.contexts[0].transport["conn"], "c-1");

    engine->validate_message(R"({"jsonrpc":"2.0","result":"pong","id":5})");
    EXPECT_EQ(call.future.get(), "pong");
}

TEST_F(EngineTest, ResponseIdMustMatchType) {
    auto engine = make_engine();
    CallOptions opts;
    opts.custom_id = RequestId{int64_t{5}};
    auto call = engine->handle_request("math.add", nlohmann::json{{"a", 2}, {"b", 3}}, opts);

    engine->validate_message(R"({"jsonrpc":"2.0","result":"wrong","id":"5"})");
    EXPECT_FALSE(is_ready(call.future));
    EXPECT_EQ(engine->stats().pending_requests.total, 1u);

    engine->validate_message(R"({"jsonrpc":"2.0","result":5,"id":5})");
    ASSERT_TRUE(is_ready(call.future));
    EXPECT_EQ(call.future.get(), 5);
}

TEST_F(EngineTest, NumericAndStringIdsAreDistinct) {
    auto engine = make_engine();
    CallOptions numeric;
    numeric.custom_id = RequestId{int64_t{7}};
    CallOptions text;
    text.custom_id = RequestId{std::string{"7"}};

    auto a = engine->handle_request("a", std::nullopt, numeric);
    auto b = engine->handle_request("b", std::nullopt, text);
    ASSERT_EQ(transport_.sent.size(), 2u);
    EXPECT_EQ(transport_.sent[0]["id"], 7);
    EXPECT_EQ(transport_.sent[1]["id"], "7");

    engine->validate_message(R"({"jsonrpc":"2.0","result":"text","id":"7"})");
    EXPECT_FALSE(is_ready(a.future));
    ASSERT_TRUE(is_ready(b.future));
    EXPECT_EQ(b.future.get(), "text");

    engine->validate_message(R"({"jsonrpc":"2.0","result":"number","id":7})");
    ASSERT_TRUE(is_ready(a.future));
    EXPECT_EQ(a.future.get(), "number");
}

TEST_F(EngineTest, NullCustomIdGeneratesOne) {
    auto engine = make_engine();
    CallOptions opts;
    opts.custom_id = RequestId{nullptr};
    auto call = engine->handle_request("ping", std::nullopt, opts);
    ASSERT_TRUE(std::holds_alternative<std::string>(call.request.id));
    EXPECT_FALSE(std::get<std::string>(call.request.id).empty());
}

TEST_F(EngineTest, RemoteErrorRejectsWithProtocolError) {
    auto engine = make_engine();
    CallOptions opts;
    opts.custom_id = RequestId{std::string{"r1"}};
    auto call = engine->handle_request("user.get", nlohmann::json{{"userId", 999}}, opts);

    engine->validate_message(
        R"({"jsonrpc":"2.0","error":{"code":-32004,"message":"User not found","data":{"userId":999}},"id":"r1"})");

    try {
        call.future.get();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code, error::AuthorizationError);
        EXPECT_STREQ(e.what(), "User not found");
        ASSERT_TRUE(e.data.has_value());
        EXPECT_EQ((*e.data)["userId"], 999);
    }
}

TEST_F(EngineTest, OutboundCallTimesOut) {
    auto engine = make_engine();
    CallOptions opts;
    opts.timeout = 20ms;
    opts.custom_id = RequestId{int64_t{1}};
    auto call = engine->handle_request("slow", std::nullopt, opts);

    run_for(150ms);
    ASSERT_TRUE(is_ready(call.future));
    EXPECT_THROW(call.future.get(), TimeoutError);

    // A late answer is ignored.
    transport_.sent.clear();
    engine->validate_message(R"({"jsonrpc":"2.0","result":1,"id":1})");
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(EngineTest, UnknownResponseIsIgnored) {
    auto engine = make_engine();
    engine->validate_message(R"({"jsonrpc":"2.0","result":1,"id":"nobody"})");
    engine->validate_message(R"({"jsonrpc":"2.0","result":1,"id":null})");
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(EngineTest, TransportFailureRejectsCall) {
    auto engine = make_engine();
    transport_.fail = true;
    auto call = engine->handle_request("ping");
    ASSERT_TRUE(is_ready(call.future));
    EXPECT_THROW(call.future.get(), TransportError);
    EXPECT_EQ(engine->stats().pending_requests.total, 0u);
}

TEST_F(EngineTest, DuplicateCustomIdThrows) {
    auto engine = make_engine();
    CallOptions opts;
    opts.custom_id = RequestId{std::string{"same"}};
    auto first = engine->handle_request("a", std::nullopt, opts);
    EXPECT_THROW((void)engine->handle_request("b", std::nullopt, opts), DuplicateIdError);
    EXPECT_EQ(transport_.sent.size(), 1u);
}

TEST_F(EngineTest, SendNotification) {
    auto engine = make_engine();
    engine->send_notification("user.updated", nlohmann::json{{"id", 1}});
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_FALSE(transport_.sent[0].contains("id"));
    EXPECT_EQ(transport_.sent[0]["method"], "user.updated");
}

// ---- Registry and lifecycle ----

TEST_F(EngineTest, MethodRegistry) {
    auto engine = make_engine();
    auto handler = [](const nlohmann::json&, const CallContext&) { return nlohmann::json(); };
    engine->register_method("b", handler);
    engine->register_method("a", handler);
    EXPECT_THROW(engine->register_method("a", handler), std::invalid_argument);
    EXPECT_THROW(engine->register_async_method("a", [](const nlohmann::json&, const CallContext&,
                                                       MethodReply) {}),
                 std::invalid_argument);

    EXPECT_TRUE(engine->has_method("a"));
    EXPECT_EQ(engine->registered_methods(), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(engine->unregister_method("a"));
    EXPECT_FALSE(engine->unregister_method("a"));
    EXPECT_FALSE(engine->has_method("a"));
}

TEST_F(EngineTest, Stats) {
    auto engine = make_engine();
    engine->register_method("x", [](const nlohmann::json&, const CallContext&) { return nlohmann::json(); });
    auto a = engine->handle_request("remote.a");
    auto b = engine->handle_request("remote.b");

    auto s = engine->stats();
    EXPECT_EQ(s.registered_methods, 1u);
    EXPECT_EQ(s.method_names, std::vector<std::string>{"x"});
    EXPECT_EQ(s.pending_requests.total, 2u);
}

TEST_F(EngineTest, DestroyRejectsPendingCalls) {
    auto engine = make_engine();
    engine->register_method("x", [](const nlohmann::json&, const CallContext&) { return nlohmann::json(); });
    auto call = engine->handle_request("remote");

    engine->destroy();
    ASSERT_TRUE(is_ready(call.future));
    try {
        call.future.get();
        FAIL() << "expected rejection";
    } catch (const Error& e) {
        EXPECT_STREQ(e.what(), "Engine destroyed");
    }
    EXPECT_TRUE(engine->registered_methods().empty());
    EXPECT_EQ(engine->stats().pending_requests.total, 0u);

    engine->destroy();
}

TEST_F(EngineTest, InvalidOptionsThrow) {
    auto opts = quiet_options();
    opts.max_batch_size = 0;
    EXPECT_THROW(make_engine(opts), std::invalid_argument);

    auto zero_timeout = quiet_options();
    zero_timeout.default_timeout = 0ms;
    EXPECT_THROW(make_engine(zero_timeout), std::invalid_argument);
}
