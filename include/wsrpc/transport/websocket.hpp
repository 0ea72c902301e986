#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <spdlog/logger.h>

namespace wsrpc {

/// Parsed ws:// or wss:// URL.
struct WebSocketUrl {
    std::string scheme;   // "ws" or "wss"
    std::string host;
    std::string port;     // defaults to 80 / 443
    std::string target;   // path plus query, at least "/"
    std::string query;    // without the leading '?'

    [[nodiscard]] bool secure() const { return scheme == "wss"; }

    /// Value of `name` in the query string, or "" when absent.
    [[nodiscard]] std::string query_param(const std::string& name) const;

    /// Throws InvalidUrlError unless the scheme is ws/wss and the host is
    /// non-empty.
    static WebSocketUrl parse(const std::string& url);
};

enum class ReadyState {
    Connecting,
    Open,
    Closing,
    Closed
};

const char* to_string(ReadyState state) noexcept;

namespace close_code {
    constexpr uint16_t Normal   = 1000;
    constexpr uint16_t Abnormal = 1006;
} // namespace close_code

struct SocketEvents {
    std::function<void()> on_open;
    /// Fired exactly once per socket, also when the connection never opened.
    std::function<void(uint16_t code, const std::string& reason)> on_close;
    std::function<void(const std::string& text)> on_message;
    std::function<void(const std::string& what)> on_error;
};

/// One WebSocket connection attempt. Not reusable: a new connection needs a
/// new socket.
class IWebSocket {
public:
    virtual ~IWebSocket() = default;

    /// Start connecting. Events are delivered on the io_context.
    virtual void open(SocketEvents events) = 0;

    [[nodiscard]] virtual ReadyState ready_state() const = 0;

    /// Queue one text frame. Throws TransportError when not Open.
    virtual void write(std::string text) = 0;

    virtual void close(uint16_t code, const std::string& reason) = 0;
};

using SocketFactory = std::function<std::shared_ptr<IWebSocket>(
    boost::asio::io_context& io, const WebSocketUrl& url)>;

/// A path frames can be written through. Returns false when the frame could
/// not be handed off.
class IFrameWriter {
public:
    virtual ~IFrameWriter() = default;

    virtual bool write_frame(const std::string& text) = 0;
};

/// Creates the alternate write path for `url`. May throw or return null when
/// the path cannot be set up.
using FrameWriterFactory = std::function<std::unique_ptr<IFrameWriter>(const WebSocketUrl& url)>;

} // namespace wsrpc
