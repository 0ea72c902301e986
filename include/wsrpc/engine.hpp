#pragma once
#include "codec.hpp"
#include "json_rpc.hpp"
#include "pending_operations.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <spdlog/logger.h>

namespace wsrpc {

/// Result of a method call: the JSON result, or the failure it raised.
using MethodOutcome = std::variant<nlohmann::json, std::exception_ptr>;

/// Completion handle given to asynchronous method handlers. Copies share one
/// state; only the first resolve()/reject() counts.
class MethodReply {
public:
    void resolve(nlohmann::json result) const;
    void reject(std::exception_ptr error) const;

    [[nodiscard]] bool settled() const noexcept;

private:
    friend class Engine;
    struct State {
        std::function<void(MethodOutcome)> complete;
        bool done = false;
    };
    explicit MethodReply(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

using MethodHandler =
    std::function<nlohmann::json(const nlohmann::json& params, const CallContext& ctx)>;
using AsyncMethodHandler =
    std::function<void(const nlohmann::json& params, const CallContext& ctx, MethodReply reply)>;

/// Maps a handler failure to the JSON-RPC error sent back to the peer.
using ErrorHandler = std::function<JsonRpcError(std::exception_ptr error, const CallContext& ctx)>;

struct EngineEvents {
    std::function<void(const std::string& method, const nlohmann::json& params,
                       const CallContext& ctx)> on_method_call;
    std::function<void(const std::string& method, const nlohmann::json& result,
                       const CallContext& ctx)> on_method_response;
    std::function<void(const std::string& method, const JsonRpcError& error,
                       const CallContext& ctx)> on_method_error;
};

struct CallOptions {
    /// Falls back to Engine::Options::default_timeout. 0 waits forever.
    std::optional<std::chrono::milliseconds> timeout;
    /// Id to put on the wire. Unset or null generates a UUID string.
    std::optional<RequestId> custom_id;
    /// Passed through to ITransport::send_message().
    nlohmann::json context;
};

struct OutboundCall {
    std::future<nlohmann::json> future;
    JsonRpcRequest request;
};

struct EngineStats {
    PendingOperationStats pending_requests;
    std::size_t registered_methods = 0;
    std::vector<std::string> method_names;
};

/// JSON-RPC 2.0 peer: serves registered methods for inbound requests and
/// notifications, and tracks outbound calls until the matching response,
/// a timeout, or destroy().
///
/// Not thread-safe: use from the thread running the io_context.
class Engine {
public:
    struct Options {
        bool strict_validation = true;
        std::chrono::milliseconds default_timeout{30000};
        std::size_t max_batch_size = 10;
        /// Empty means default_error_handler.
        ErrorHandler error_handler;
        bool enable_auto_cleanup = true;
        std::chrono::milliseconds cleanup_interval{30000};
        /// Generates ids for outbound calls. Empty means generate_uuid.
        IdGenerator generate_id;
    };

    Engine(boost::asio::io_context& io,
           ITransport& transport,
           Options opts,
           EngineEvents events = {},
           std::shared_ptr<spdlog::logger> logger = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ---- Method registry ----

    /// Throws std::invalid_argument if `name` is already registered.
    void register_method(const std::string& name, MethodHandler handler);
    void register_async_method(const std::string& name, AsyncMethodHandler handler);
    bool unregister_method(const std::string& name);
    [[nodiscard]] bool has_method(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> registered_methods() const;

    // ---- Outbound ----

    /// Send a request and track it. The future holds the peer's result, or
    /// ProtocolError / TimeoutError / Error("Engine destroyed").
    /// Throws DuplicateIdError if `custom_id` is already in flight.
    [[nodiscard]] OutboundCall handle_request(const std::string& method,
                                              std::optional<nlohmann::json> params = std::nullopt,
                                              CallOptions opts = {});

    void send_notification(const std::string& method,
                           std::optional<nlohmann::json> params = std::nullopt,
                           const nlohmann::json& context = nullptr);

    // ---- Inbound ----

    /// Entry point for raw inbound data. Never throws: malformed or invalid
    /// input is answered with an error response.
    void validate_message(std::string_view data, const nlohmann::json& context = nullptr);

    /// Dispatch an already decoded and classified message.
    void dispatch(const ValidationResult& validation, const nlohmann::json& context = nullptr);

    [[nodiscard]] EngineStats stats() const;

    /// Reject every in-flight call with "Engine destroyed" and drop all
    /// methods. Safe to call twice.
    void destroy();

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

    /// Case-sensitive substring heuristic: ProtocolError keeps its code; "timeout" maps to
    /// TIMEOUT_ERROR, "connection" to CONNECTION_ERROR, anything else to
    /// INTERNAL_ERROR with the message in data.errorType.
    static JsonRpcError default_error_handler(std::exception_ptr error, const CallContext& ctx);

private:
    struct MethodEntry {
        MethodHandler sync;
        AsyncMethodHandler async;
    };
    using ResponseCallback = std::function<void(std::optional<JsonRpcResponse>)>;

    void add_method(const std::string& name, MethodEntry entry);
    void invoke(const MethodEntry& entry, const nlohmann::json& params,
                const CallContext& ctx, std::function<void(MethodOutcome)> complete);

    void process_request(const JsonRpcRequest& req, const nlohmann::json& context,
                         ResponseCallback done);
    void process_notification(const JsonRpcNotification& notif, const nlohmann::json& context);
    void process_response(const JsonRpcResponse& resp);
    void process_batch(const nlohmann::json& batch, const nlohmann::json& context);

    JsonRpcError map_error(std::exception_ptr error, const CallContext& ctx);
    void send(const nlohmann::json& message, const nlohmann::json& context);
    void send_error(const RequestId& id, JsonRpcError error, const nlohmann::json& context);

    ITransport& transport_;
    Options opts_;
    EngineEvents events_;
    std::shared_ptr<spdlog::logger> logger_;
    PromiseOperations pending_;
    std::map<std::string, MethodEntry> methods_;
    std::shared_ptr<int> alive_;
};

} // namespace wsrpc
