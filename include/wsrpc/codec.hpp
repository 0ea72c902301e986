#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace wsrpc {

enum class MessageKind {
    Request,
    Notification,
    Response,
    Batch
};

/// Outcome of classifying a decoded JSON value.
struct ValidationResult {
    bool valid = false;
    /// The decoded envelope (object, or array for batches).
    nlohmann::json message;
    std::optional<MessageKind> kind;
    /// Set when !valid.
    std::optional<JsonRpcError> error;
    /// Id to echo in an error response: the envelope's id when it has a
    /// usable one, otherwise null.
    RequestId error_id;
};

class Codec {
public:
    /// Decode raw JSON text. Throws ParseError on malformed input.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Classify a decoded value as request, notification, response or batch.
    /// Never throws; problems are reported as INVALID_REQUEST errors.
    /// With `strict`, params must be structured and responses must carry
    /// exactly one of result/error with a well-formed error object.
    [[nodiscard]] static ValidationResult validate(const nlohmann::json& message,
                                                   bool strict = true);

    /// Classify a single (non-batch) envelope.
    [[nodiscard]] static ValidationResult validate_single(const nlohmann::json& message,
                                                          bool strict = true);

    /// Build the typed message for a validated single envelope.
    [[nodiscard]] static JsonRpcMessage to_message(const nlohmann::json& j);

    /// Parse raw bytes into a single typed message.
    /// Throws ParseError on invalid JSON or an invalid envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse a batch of messages (JSON array).
    [[nodiscard]] static std::vector<JsonRpcMessage> parse_batch(std::string_view raw);

    /// Serialize a message to JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Serialize a batch.
    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcMessage>& msgs);
};

} // namespace wsrpc
