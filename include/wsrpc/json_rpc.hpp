#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace wsrpc {

/// JSON-RPC id: null, integer or string. The alternative held is preserved
/// end to end so a response echoes exactly what the request carried.
using RequestId = std::variant<std::nullptr_t, int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_null()) {
        id = nullptr;
    } else if (j.is_number_integer() &&
               !(j.is_number_unsigned() &&
                 j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be null, 64-bit signed integer or string");
    }
}

/// True if `j` can be read as a RequestId without losing its value.
inline bool is_valid_id(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return j.is_null() || j.is_number_integer() || j.is_string();
}

/// Key under which an outbound call is tracked: the id's JSON text, so 5
/// and "5" never share a key. Null ids have no key ("").
std::string id_key(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
    bool operator!=(const JsonRpcError& o) const { return !(*this == o); }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

// ---- Builders ----

[[nodiscard]] JsonRpcError make_error(int code, std::string message,
                                      std::optional<nlohmann::json> data = std::nullopt);

/// Error using the standard message for `code`.
[[nodiscard]] JsonRpcError make_error(int code);

[[nodiscard]] JsonRpcResponse make_success_response(RequestId id, nlohmann::json result);
[[nodiscard]] JsonRpcResponse make_error_response(RequestId id, JsonRpcError error);

} // namespace wsrpc
