#include "wsrpc/json_rpc.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/version.hpp"

namespace wsrpc {

std::string id_key(const RequestId& id) {
    if (std::holds_alternative<std::nullptr_t>(id)) return "";
    nlohmann::json j;
    to_json(j, id);
    return j.dump();
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
    j["id"] = id_j;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
    j["id"] = id_j;
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    if (j.contains("id")) {
        from_json(j.at("id"), r.id);
    } else {
        r.id = nullptr;
    }
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

JsonRpcError make_error(int code, std::string message, std::optional<nlohmann::json> data) {
    return JsonRpcError{code, std::move(message), std::move(data)};
}

JsonRpcError make_error(int code) {
    return JsonRpcError{code, error::standard_message(code), std::nullopt};
}

JsonRpcResponse make_success_response(RequestId id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error_response(RequestId id, JsonRpcError error) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = std::move(error);
    return resp;
}

} // namespace wsrpc
