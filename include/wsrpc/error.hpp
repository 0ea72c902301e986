#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace wsrpc {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ParseError : public Error {
public:
    using Error::Error;
};

/// Error carrying an explicit JSON-RPC code. Thrown by method handlers to
/// select a code, and stored in a caller's future when the peer answers
/// with an error response.
class ProtocolError : public Error {
public:
    int code;
    std::optional<nlohmann::json> data;
    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> data = std::nullopt)
        : Error(msg), code(code), data(std::move(data)) {}
};

class TransportError : public Error {
public:
    using Error::Error;
};

class TimeoutError : public Error {
public:
    using Error::Error;
};

class DuplicateIdError : public Error {
public:
    using Error::Error;
};

class InvalidUrlError : public Error {
public:
    using Error::Error;
};

namespace error {
    constexpr int ParseError          = -32700;
    constexpr int InvalidRequest      = -32600;
    constexpr int MethodNotFound      = -32601;
    constexpr int InvalidParams       = -32602;
    constexpr int InternalError       = -32603;
    constexpr int ServerErrorStart    = -32099;
    constexpr int ServerErrorEnd      = -32000;
    constexpr int TimeoutError        = -32001;
    constexpr int ConnectionError     = -32002;
    constexpr int AuthenticationError = -32003;
    constexpr int AuthorizationError  = -32004;
    constexpr int RateLimitError      = -32005;
    constexpr int ValidationError     = -32006;

    /// Human-readable default message for a code ("Server error" for the
    /// implementation-defined range, "Unknown error" otherwise).
    const char* standard_message(int code) noexcept;
} // namespace error

} // namespace wsrpc
