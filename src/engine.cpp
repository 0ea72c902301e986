#include "wsrpc/engine.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/log.hpp"
#include <stdexcept>

namespace wsrpc {

namespace {

PendingOperations::Options pending_options(const Engine::Options& opts) {
    PendingOperations::Options p;
    p.default_timeout = opts.default_timeout;
    p.cleanup_interval = opts.cleanup_interval;
    p.enable_auto_cleanup = opts.enable_auto_cleanup;
    if (opts.generate_id) p.generate_id = opts.generate_id;
    return p;
}

nlohmann::json params_or_empty(const std::optional<nlohmann::json>& params) {
    if (!params || params->is_null()) return nlohmann::json::object();
    return *params;
}

// Observer hooks never change the outcome of a call.
template <typename Hook, typename Payload>
void fire_hook(spdlog::logger& logger, const char* name, const Hook& hook,
               const std::string& method, const Payload& payload, const CallContext& ctx) {
    if (!hook) return;
    try {
        hook(method, payload, ctx);
    } catch (const std::exception& e) {
        logger.error("{} hook failed for {}: {}", name, method, e.what());
    }
}

} // anonymous namespace

// ---------- MethodReply ----------

void MethodReply::resolve(nlohmann::json result) const {
    if (!state_ || state_->done) return;
    state_->done = true;
    if (state_->complete) state_->complete(MethodOutcome(std::in_place_index<0>, std::move(result)));
}

void MethodReply::reject(std::exception_ptr error) const {
    if (!state_ || state_->done) return;
    state_->done = true;
    if (!error) error = std::make_exception_ptr(Error("Method failed"));
    if (state_->complete) state_->complete(MethodOutcome(std::in_place_index<1>, error));
}

bool MethodReply::settled() const noexcept {
    return !state_ || state_->done;
}

// ---------- Engine ----------

Engine::Engine(boost::asio::io_context& io,
               ITransport& transport,
               Options opts,
               EngineEvents events,
               std::shared_ptr<spdlog::logger> logger)
    : transport_(transport)
    , opts_(std::move(opts))
    , events_(std::move(events))
    , logger_(log::or_default(std::move(logger), "JSON-RPC-Engine"))
    , pending_(io, pending_options(opts_), {}, logger_)
    , alive_(std::make_shared<int>(0)) {
    if (opts_.max_batch_size == 0) {
        throw std::invalid_argument("max_batch_size must be greater than zero");
    }
    if (!opts_.error_handler) {
        opts_.error_handler = &Engine::default_error_handler;
    }
}

Engine::~Engine() {
    destroy();
    alive_.reset();
}

void Engine::add_method(const std::string& name, MethodEntry entry) {
    if (methods_.count(name) > 0) {
        throw std::invalid_argument("Method '" + name + "' is already registered");
    }
    methods_.emplace(name, std::move(entry));
    logger_->debug("Registered method {}", name);
}

void Engine::register_method(const std::string& name, MethodHandler handler) {
    add_method(name, MethodEntry{std::move(handler), nullptr});
}

void Engine::register_async_method(const std::string& name, AsyncMethodHandler handler) {
    add_method(name, MethodEntry{nullptr, std::move(handler)});
}

bool Engine::unregister_method(const std::string& name) {
    return methods_.erase(name) > 0;
}

bool Engine::has_method(const std::string& name) const {
    return methods_.count(name) > 0;
}

std::vector<std::string> Engine::registered_methods() const {
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& [name, entry] : methods_) {
        names.push_back(name);
    }
    return names;
}

// ---------- Outbound ----------

OutboundCall Engine::handle_request(const std::string& method,
                                    std::optional<nlohmann::json> params,
                                    CallOptions opts) {
    JsonRpcRequest req;
    req.method = method;
    req.params = std::move(params);
    if (opts.custom_id && !std::holds_alternative<std::nullptr_t>(*opts.custom_id)) {
        req.id = *opts.custom_id;
    } else {
        req.id = pending_.options().generate_id();
    }

    AddOptions add_opts;
    add_opts.timeout = opts.timeout;
    add_opts.custom_id = id_key(req.id);
    nlohmann::json summary = {{"method", method}};
    auto added = pending_.add(std::move(summary), add_opts);

    CallContext ctx{opts.context, method, req.id};
    nlohmann::json message = req;
    try {
        transport_.send_message(message, ctx);
    } catch (const std::exception& e) {
        logger_->error("Failed to send request {} ({}): {}", added.id, method, e.what());
        pending_.reject(added.id, std::current_exception());
    }
    return OutboundCall{std::move(added.future), std::move(req)};
}

void Engine::send_notification(const std::string& method,
                               std::optional<nlohmann::json> params,
                               const nlohmann::json& context) {
    JsonRpcNotification notif{method, std::move(params)};
    CallContext ctx{context, method, std::nullopt};
    transport_.send_message(nlohmann::json(notif), ctx);
}

// ---------- Inbound ----------

void Engine::validate_message(std::string_view data, const nlohmann::json& context) {
    nlohmann::json parsed;
    try {
        parsed = Codec::parse_json(data);
    } catch (const ParseError& e) {
        logger_->warn("Discarding malformed message: {}", e.what());
        send_error(nullptr, make_error(error::ParseError), context);
        return;
    }
    dispatch(Codec::validate(parsed, opts_.strict_validation), context);
}

void Engine::dispatch(const ValidationResult& validation, const nlohmann::json& context) {
    if (!validation.valid) {
        JsonRpcError err = validation.error ? *validation.error : make_error(error::InvalidRequest);
        logger_->warn("Rejecting invalid message: {}", err.message);
        send_error(validation.error_id, std::move(err), context);
        return;
    }

    try {
        if (validation.kind == MessageKind::Batch) {
            process_batch(validation.message, context);
            return;
        }

        auto msg = Codec::to_message(validation.message);
        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            std::weak_ptr<int> alive = alive_;
            process_request(*req, context,
                            [this, alive, context](std::optional<JsonRpcResponse> resp) {
                if (alive.expired() || !resp) return;
                send(nlohmann::json(*resp), context);
            });
        } else if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            process_notification(*notif, context);
        } else if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            process_response(*resp);
        }
    } catch (const std::exception& e) {
        logger_->error("Internal error while processing message: {}", e.what());
        send_error(nullptr, make_error(error::InternalError), context);
    }
}

void Engine::invoke(const MethodEntry& entry, const nlohmann::json& params,
                    const CallContext& ctx, std::function<void(MethodOutcome)> complete) {
    if (entry.async) {
        auto state = std::make_shared<MethodReply::State>();
        state->complete = std::move(complete);
        MethodReply reply(state);
        try {
            entry.async(params, ctx, reply);
        } catch (...) {
            // A throw after the handler already replied has nowhere to go.
            if (reply.settled()) {
                logger_->warn("Method {} threw after replying", ctx.method);
            } else {
                reply.reject(std::current_exception());
            }
        }
        return;
    }

    MethodOutcome outcome;
    try {
        outcome.emplace<0>(entry.sync(params, ctx));
    } catch (...) {
        outcome.emplace<1>(std::current_exception());
    }
    complete(std::move(outcome));
}

void Engine::process_request(const JsonRpcRequest& req, const nlohmann::json& context,
                             ResponseCallback done) {
    CallContext ctx{context, req.method, req.id};

    auto it = methods_.find(req.method);
    if (it == methods_.end()) {
        logger_->warn("Method not found: {}", req.method);
        JsonRpcError err = make_error(error::MethodNotFound,
                                      "Method '" + req.method + "' not found");
        fire_hook(*logger_, "on_method_error", events_.on_method_error, req.method, err, ctx);
        done(make_error_response(req.id, std::move(err)));
        return;
    }

    // Copy so the handler survives unregister_method() during the call.
    MethodEntry entry = it->second;
    nlohmann::json params = params_or_empty(req.params);
    fire_hook(*logger_, "on_method_call", events_.on_method_call, req.method, params, ctx);

    std::weak_ptr<int> alive = alive_;
    invoke(entry, params, ctx,
           [this, alive, ctx, done = std::move(done)](MethodOutcome outcome) {
        if (alive.expired()) return;
        if (auto* result = std::get_if<nlohmann::json>(&outcome)) {
            fire_hook(*logger_, "on_method_response", events_.on_method_response,
                      ctx.method, *result, ctx);
            done(make_success_response(*ctx.id, std::move(*result)));
            return;
        }
        JsonRpcError err = map_error(std::get<std::exception_ptr>(outcome), ctx);
        logger_->debug("Method {} failed: {} ({})", ctx.method, err.message, err.code);
        fire_hook(*logger_, "on_method_error", events_.on_method_error, ctx.method, err, ctx);
        done(make_error_response(*ctx.id, std::move(err)));
    });
}

void Engine::process_notification(const JsonRpcNotification& notif,
                                  const nlohmann::json& context) {
    CallContext ctx{context, notif.method, std::nullopt};

    auto it = methods_.find(notif.method);
    if (it == methods_.end()) {
        logger_->warn("No handler for notification {}", notif.method);
        return;
    }

    MethodEntry entry = it->second;
    nlohmann::json params = params_or_empty(notif.params);
    fire_hook(*logger_, "on_method_call", events_.on_method_call, notif.method, params, ctx);

    std::weak_ptr<int> alive = alive_;
    invoke(entry, params, ctx, [this, alive, ctx](MethodOutcome outcome) {
        if (alive.expired()) return;
        if (auto* result = std::get_if<nlohmann::json>(&outcome)) {
            fire_hook(*logger_, "on_method_response", events_.on_method_response,
                      ctx.method, *result, ctx);
            return;
        }
        JsonRpcError err = map_error(std::get<std::exception_ptr>(outcome), ctx);
        logger_->error("Notification {} failed: {}", ctx.method, err.message);
        fire_hook(*logger_, "on_method_error", events_.on_method_error, ctx.method, err, ctx);
    });
}

void Engine::process_response(const JsonRpcResponse& resp) {
    std::string key = id_key(resp.id);
    if (std::holds_alternative<std::nullptr_t>(resp.id) || !pending_.has(key)) {
        logger_->debug("Ignoring response for unknown request id '{}'", key);
        return;
    }
    if (resp.error) {
        const auto& e = *resp.error;
        pending_.reject(key, std::make_exception_ptr(ProtocolError(e.code, e.message, e.data)));
    } else {
        pending_.resolve(key, resp.result ? *resp.result : nlohmann::json(nullptr));
    }
}

void Engine::process_batch(const nlohmann::json& batch, const nlohmann::json& context) {
    if (batch.size() > opts_.max_batch_size) {
        logger_->warn("Rejecting batch of {} items (max {})", batch.size(), opts_.max_batch_size);
        send_error(nullptr,
                   make_error(error::InvalidRequest,
                              "Batch size " + std::to_string(batch.size()) +
                              " exceeds maximum allowed size " +
                              std::to_string(opts_.max_batch_size)),
                   context);
        return;
    }

    struct Gather {
        std::vector<std::optional<JsonRpcResponse>> results;
        std::size_t remaining = 0;
    };
    auto gather = std::make_shared<Gather>();
    gather->results.resize(batch.size());
    gather->remaining = batch.size();

    std::weak_ptr<int> alive = alive_;
    auto item_done = [this, alive, gather, context](std::size_t index,
                                                    std::optional<JsonRpcResponse> resp) {
        gather->results[index] = std::move(resp);
        if (--gather->remaining > 0 || alive.expired()) return;

        nlohmann::json out = nlohmann::json::array();
        for (const auto& r : gather->results) {
            if (r) out.push_back(*r);
        }
        if (!out.empty()) send(out, context);
    };

    for (std::size_t i = 0; i < batch.size(); ++i) {
        auto msg = Codec::to_message(batch[i]);
        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            process_request(*req, context, [item_done, i](std::optional<JsonRpcResponse> resp) {
                item_done(i, std::move(resp));
            });
            continue;
        }
        if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            process_notification(*notif, context);
        } else if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            process_response(*resp);
        }
        item_done(i, std::nullopt);
    }
}

JsonRpcError Engine::map_error(std::exception_ptr error, const CallContext& ctx) {
    try {
        return opts_.error_handler(error, ctx);
    } catch (const std::exception& e) {
        logger_->error("Error handler failed: {}", e.what());
        return make_error(error::InternalError);
    }
}

JsonRpcError Engine::default_error_handler(std::exception_ptr error, const CallContext&) {
    try {
        if (error) std::rethrow_exception(error);
    } catch (const ProtocolError& e) {
        return make_error(e.code, e.what(), e.data);
    } catch (const std::exception& e) {
        std::string message = e.what();
        if (message.find("timeout") != std::string::npos) {
            return make_error(error::TimeoutError, "Request timeout");
        }
        if (message.find("connection") != std::string::npos) {
            return make_error(error::ConnectionError, "Connection error");
        }
        return make_error(error::InternalError, "Internal error",
                          nlohmann::json{{"errorType", message}});
    } catch (...) {
        return make_error(error::InternalError, "Internal error",
                          nlohmann::json{{"errorType", "unknown"}});
    }
    return make_error(error::InternalError);
}

void Engine::send(const nlohmann::json& message, const nlohmann::json& context) {
    try {
        transport_.send_message(message, CallContext{context, "", std::nullopt});
    } catch (const std::exception& e) {
        logger_->error("Failed to send message: {}", e.what());
    }
}

void Engine::send_error(const RequestId& id, JsonRpcError error, const nlohmann::json& context) {
    send(nlohmann::json(make_error_response(id, std::move(error))), context);
}

// ---------- Lifecycle ----------

EngineStats Engine::stats() const {
    EngineStats s;
    s.pending_requests = pending_.stats();
    s.method_names = registered_methods();
    s.registered_methods = s.method_names.size();
    return s;
}

void Engine::destroy() {
    pending_.destroy("Engine destroyed");
    methods_.clear();
}

} // namespace wsrpc
