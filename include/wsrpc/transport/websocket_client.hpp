#pragma once
#include "transport.hpp"
#include "websocket.hpp"
#include "../codec.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/logger.h>

namespace wsrpc {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

const char* to_string(ConnectionState state) noexcept;

struct ConnectionInfo {
    std::string url;
    bool connected = false;
    /// `clientId` query parameter of the URL, else the server-assigned
    /// connection id, else empty.
    std::string client_id;
    std::optional<std::string> connection_id;
};

class WebSocketClient;

/// Receives every valid inbound message except the reserved
/// "server.connected" notification.
using ClientMessageHandler = std::function<void(const ValidationResult& message,
                                                WebSocketClient& client)>;

/// JSON-RPC client over one WebSocket connection that survives drops:
/// unexpected closes reconnect with exponential backoff, and a heartbeat
/// ping keeps idle connections alive. Implements ITransport so an Engine can
/// write through it.
///
/// Not thread-safe: use from the thread running the io_context.
class WebSocketClient : public ITransport {
public:
    struct Options {
        int max_reconnect_attempts = 10;
        std::chrono::milliseconds initial_reconnect_delay{1000};
        std::chrono::milliseconds max_reconnect_delay{30000};
        double backoff_factor = 2.0;
        /// After giving up, start a fresh reconnect cycle after this long.
        /// 0 stays disconnected.
        std::chrono::milliseconds reconnect_cooldown{0};
        std::chrono::milliseconds heartbeat_interval{30000};
        bool enable_keep_alive = true;
        /// Suggested timeout for calls made over this client.
        std::chrono::milliseconds call_timeout{5000};
        ClientMessageHandler handle_message;
        /// Fired each time a connection opens.
        std::function<void(WebSocketClient&)> on_connected;
        /// Empty means beast_socket_factory().
        SocketFactory socket_factory;
        /// Alternate write path for send(..., true). Empty means unsupported.
        FrameWriterFactory stream_writer_factory;
    };

    /// Throws InvalidUrlError for anything but a ws:// or wss:// URL with a
    /// host, std::invalid_argument for inconsistent options.
    WebSocketClient(boost::asio::io_context& io,
                    const std::string& url,
                    Options opts,
                    std::shared_ptr<spdlog::logger> logger = nullptr);
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void connect();

    /// Close with 1000 "Manual disconnect". No reconnect follows.
    void disconnect();

    /// Drop the current connection and reconnect with a fresh backoff cycle.
    void force_reconnect();

    /// Send a JSON object as one text frame, adding "jsonrpc":"2.0". Returns
    /// false if `data` is not an object or the frame could not be written.
    bool send(const nlohmann::json& data, bool use_alternate_stream = false);

    /// ITransport: objects go through send(), batch arrays are written as is.
    /// Throws TransportError when not connected.
    void send_message(const nlohmann::json& message, const CallContext& context) override;

    void set_message_handler(ClientMessageHandler handler);

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] ConnectionInfo info() const;
    [[nodiscard]] const WebSocketUrl& url() const noexcept { return url_; }

    [[nodiscard]] std::chrono::milliseconds heartbeat_interval() const { return opts_.heartbeat_interval; }
    [[nodiscard]] bool enable_keep_alive() const { return opts_.enable_keep_alive; }
    [[nodiscard]] std::chrono::milliseconds call_timeout() const { return opts_.call_timeout; }
    [[nodiscard]] int reconnect_attempts() const noexcept { return reconnect_attempts_; }

    /// min(initial * factor^attempt, max).
    [[nodiscard]] std::chrono::milliseconds next_reconnect_delay(int attempt) const;

private:
    class SocketFrameWriter;

    void open_socket();
    void on_open(uint64_t generation);
    void on_close(uint64_t generation, uint16_t code, const std::string& reason);
    void on_message(uint64_t generation, const std::string& text);
    void schedule_reconnect();
    void start_heartbeat();
    void stop_heartbeat();
    bool write_alternate(const std::string& text);
    bool write_text(const std::string& text);

    boost::asio::io_context& io_;
    std::string raw_url_;
    WebSocketUrl url_;
    Options opts_;
    std::shared_ptr<spdlog::logger> logger_;

    std::shared_ptr<IWebSocket> socket_;
    std::unique_ptr<IFrameWriter> primary_writer_;
    std::unique_ptr<IFrameWriter> alternate_writer_;

    ConnectionState state_{ConnectionState::Disconnected};
    uint64_t generation_{0};
    int reconnect_attempts_{0};
    bool manual_disconnect_{false};
    std::optional<std::string> connection_id_;

    boost::asio::steady_timer reconnect_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    std::shared_ptr<int> alive_;
};

} // namespace wsrpc
