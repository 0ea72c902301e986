#include "wsrpc/codec.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace wsrpc {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// Top-level scalars cannot be read through get_value(); use the document getters.
nlohmann::json simdjson_scalar_doc_to_nlohmann(simdjson::ondemand::document& doc,
                                               simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            std::string_view sv;
            if (doc.get_string().get(sv) == simdjson::SUCCESS) {
                return nlohmann::json(std::string(sv));
            }
            break;
        }
        case simdjson::ondemand::json_type::number: {
            int64_t i = 0;
            if (doc.get_int64().get(i) == simdjson::SUCCESS) return nlohmann::json(i);
            uint64_t u = 0;
            if (doc.get_uint64().get(u) == simdjson::SUCCESS) return nlohmann::json(u);
            double d = 0;
            if (doc.get_double().get(d) == simdjson::SUCCESS) return nlohmann::json(d);
            break;
        }
        case simdjson::ondemand::json_type::boolean: {
            bool b = false;
            if (doc.get_bool().get(b) == simdjson::SUCCESS) return nlohmann::json(b);
            break;
        }
        case simdjson::ondemand::json_type::null: {
            bool is_null = false;
            if (doc.is_null().get(is_null) == simdjson::SUCCESS && is_null) {
                return nlohmann::json(nullptr);
            }
            break;
        }
        default:
            break;
    }
    throw ParseError("Invalid top-level JSON value");
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    simdjson::ondemand::json_type type;
    if (doc.type().get(type) != simdjson::SUCCESS) {
        throw ParseError("Failed to get document type");
    }

    nlohmann::json j;
    if (type == simdjson::ondemand::json_type::object ||
        type == simdjson::ondemand::json_type::array) {
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError("Failed to get document value");
        }
        j = simdjson_to_nlohmann(val.value());
    } else {
        j = simdjson_scalar_doc_to_nlohmann(doc, type);
    }
    if (!doc.at_end()) {
        throw ParseError("Trailing content after JSON document");
    }
    return j;
}

ValidationResult invalid(const nlohmann::json& message, std::string reason) {
    ValidationResult r;
    r.valid = false;
    r.message = message;
    r.error = make_error(error::InvalidRequest, "Invalid request: " + std::move(reason));
    if (message.is_object() && message.contains("id") && is_valid_id(message.at("id"))) {
        from_json(message.at("id"), r.error_id);
    }
    return r;
}

ValidationResult valid(const nlohmann::json& message, MessageKind kind) {
    ValidationResult r;
    r.valid = true;
    r.message = message;
    r.kind = kind;
    if (message.is_object() && message.contains("id") && is_valid_id(message.at("id"))) {
        from_json(message.at("id"), r.error_id);
    }
    return r;
}

bool is_structured_params(const nlohmann::json& p) {
    return p.is_object() || p.is_array() || p.is_null();
}

bool is_error_object(const nlohmann::json& e) {
    return e.is_object() && e.contains("code") && e.at("code").is_number_integer() &&
           e.contains("message") && e.at("message").is_string();
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    // simdjson requires padded input
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        return simdjson_doc_to_nlohmann(doc);
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }
}

ValidationResult Codec::validate_single(const nlohmann::json& message, bool strict) {
    if (!message.is_object()) {
        return invalid(message, "message must be an object");
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() ||
        version->get<std::string>() != JSONRPC_VERSION) {
        std::string received = version == message.end() ? "nothing" : version->dump();
        return invalid(message, "expected " + std::string(JSONRPC_VERSION) +
                                ", received " + received);
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        bool has_result = message.contains("result");
        bool has_error = message.contains("error");
        if (!has_result && !has_error) {
            return invalid(message, "method must be a string");
        }
        if (message.contains("id") && !is_valid_id(message.at("id"))) {
            return invalid(message, "id must be a string, integer or null");
        }
        if (strict) {
            if (has_result && has_error) {
                return invalid(message, "response must not carry both result and error");
            }
            if (has_error && !is_error_object(message.at("error"))) {
                return invalid(message, "error must have an integer code and a string message");
            }
        }
        return valid(message, MessageKind::Response);
    }

    if (strict && message.contains("params") && !is_structured_params(message.at("params"))) {
        return invalid(message, "params must be an object, array or null");
    }

    if (message.contains("id")) {
        if (!is_valid_id(message.at("id"))) {
            return invalid(message, "id must be a string, integer or null");
        }
        return valid(message, MessageKind::Request);
    }
    return valid(message, MessageKind::Notification);
}

ValidationResult Codec::validate(const nlohmann::json& message, bool strict) {
    if (!message.is_array()) {
        return validate_single(message, strict);
    }
    if (message.empty()) {
        return invalid(message, "batch array cannot be empty");
    }
    for (const auto& item : message) {
        auto item_result = validate_single(item, strict);
        if (!item_result.valid) {
            return item_result;
        }
    }
    return valid(message, MessageKind::Batch);
}

JsonRpcMessage Codec::to_message(const nlohmann::json& j) {
    bool has_method = j.contains("method") && j.at("method").is_string();
    if (has_method && j.contains("id")) {
        JsonRpcRequest req;
        from_json(j, req);
        return req;
    }
    if (has_method) {
        JsonRpcNotification notif;
        from_json(j, notif);
        return notif;
    }
    JsonRpcResponse resp;
    from_json(j, resp);
    return resp;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    auto result = validate_single(j);
    if (!result.valid) {
        throw ParseError(result.error->message);
    }
    try {
        return to_message(j);
    } catch (const std::exception& e) {
        throw ParseError(std::string("Malformed message: ") + e.what());
    }
}

std::vector<JsonRpcMessage> Codec::parse_batch(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_array()) {
        throw ParseError("Batch must be a JSON array");
    }

    std::vector<JsonRpcMessage> messages;
    messages.reserve(j.size());
    for (const auto& item : j) {
        auto result = validate_single(item);
        if (!result.valid) {
            throw ParseError(result.error->message);
        }
        messages.push_back(to_message(item));
    }
    return messages;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::string Codec::serialize_batch(const std::vector<JsonRpcMessage>& msgs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& msg : msgs) {
        nlohmann::json j;
        to_json(j, msg);
        arr.push_back(std::move(j));
    }
    return arr.dump();
}

} // namespace wsrpc
