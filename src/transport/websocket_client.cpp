#include "wsrpc/transport/websocket_client.hpp"
#include "wsrpc/transport/beast_websocket.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/log.hpp"
#include "wsrpc/version.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace wsrpc {

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

/// Primary write path: the client's current socket.
class WebSocketClient::SocketFrameWriter : public IFrameWriter {
public:
    explicit SocketFrameWriter(WebSocketClient& client) : client_(client) {}

    bool write_frame(const std::string& text) override { return client_.write_text(text); }

private:
    WebSocketClient& client_;
};

WebSocketClient::WebSocketClient(boost::asio::io_context& io,
                                 const std::string& url,
                                 Options opts,
                                 std::shared_ptr<spdlog::logger> logger)
    : io_(io)
    , raw_url_(url)
    , url_(WebSocketUrl::parse(url))
    , opts_(std::move(opts))
    , logger_(log::or_default(std::move(logger), "WebSocket-Client"))
    , primary_writer_(std::make_unique<SocketFrameWriter>(*this))
    , reconnect_timer_(io)
    , heartbeat_timer_(io)
    , alive_(std::make_shared<int>(0)) {
    if (opts_.max_reconnect_attempts < 0) {
        throw std::invalid_argument("max_reconnect_attempts must not be negative");
    }
    if (opts_.backoff_factor < 1.0) {
        throw std::invalid_argument("backoff_factor must be at least 1");
    }
    if (opts_.initial_reconnect_delay.count() < 0 || opts_.max_reconnect_delay.count() < 0) {
        throw std::invalid_argument("reconnect delays must not be negative");
    }
    if (opts_.enable_keep_alive && opts_.heartbeat_interval.count() <= 0) {
        throw std::invalid_argument("heartbeat_interval must be greater than zero");
    }
    if (!opts_.socket_factory) {
        opts_.socket_factory = beast_socket_factory(logger_);
    }
}

WebSocketClient::~WebSocketClient() {
    manual_disconnect_ = true;
    ++generation_;
    reconnect_timer_.cancel();
    heartbeat_timer_.cancel();
    if (socket_ && socket_->ready_state() != ReadyState::Closed) {
        socket_->close(close_code::Normal, "Client destroyed");
    }
    alive_.reset();
}

void WebSocketClient::connect() {
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
        logger_->debug("connect() ignored, already {}", to_string(state_));
        return;
    }
    manual_disconnect_ = false;
    reconnect_timer_.cancel();
    state_ = ConnectionState::Connecting;
    logger_->info("Connecting to {}", raw_url_);
    open_socket();
}

void WebSocketClient::open_socket() {
    uint64_t gen = ++generation_;
    std::weak_ptr<int> alive = alive_;

    SocketEvents events;
    events.on_open = [this, alive, gen]() {
        if (!alive.expired()) on_open(gen);
    };
    events.on_close = [this, alive, gen](uint16_t code, const std::string& reason) {
        if (!alive.expired()) on_close(gen, code, reason);
    };
    events.on_message = [this, alive, gen](const std::string& text) {
        if (!alive.expired()) on_message(gen, text);
    };
    events.on_error = [this, alive, gen](const std::string& what) {
        if (alive.expired() || gen != generation_) return;
        logger_->warn("WebSocket error on {}: {}", raw_url_, what);
    };

    try {
        socket_ = opts_.socket_factory(io_, url_);
        if (!socket_) {
            throw TransportError("socket factory returned no socket");
        }
        socket_->open(std::move(events));
    } catch (const std::exception& e) {
        logger_->error("Failed to open WebSocket to {}: {}", raw_url_, e.what());
        socket_.reset();
        // Report it like any failed connection so the reconnect path runs.
        boost::asio::post(io_, [this, alive, gen, reason = std::string(e.what())]() {
            if (!alive.expired()) on_close(gen, close_code::Abnormal, reason);
        });
    }
}

void WebSocketClient::on_open(uint64_t generation) {
    if (generation != generation_) return;

    reconnect_attempts_ = 0;
    state_ = ConnectionState::Connected;
    logger_->info("Connected to {}", raw_url_);
    if (opts_.enable_keep_alive) {
        start_heartbeat();
    }
    if (opts_.on_connected) {
        opts_.on_connected(*this);
    }
}

void WebSocketClient::on_close(uint64_t generation, uint16_t code, const std::string& reason) {
    if (generation != generation_) return;

    stop_heartbeat();
    connection_id_.reset();
    socket_.reset();
    logger_->info("Connection to {} closed ({}): {}", raw_url_, code, reason);

    if (manual_disconnect_) {
        state_ = ConnectionState::Disconnected;
        return;
    }
    schedule_reconnect();
}

void WebSocketClient::on_message(uint64_t generation, const std::string& text) {
    if (generation != generation_) return;

    ValidationResult result;
    try {
        result = Codec::validate(Codec::parse_json(text));
    } catch (const ParseError& e) {
        logger_->warn("Dropping malformed frame: {}", e.what());
        return;
    }
    if (!result.valid) {
        logger_->warn("Dropping invalid message: {}", result.error ? result.error->message : "");
        return;
    }

    if (result.kind == MessageKind::Notification &&
        result.message.at("method") == "server.connected") {
        auto params = result.message.value("params", nlohmann::json::object());
        if (params.is_object() && params.contains("connectionId")) {
            const auto& id = params.at("connectionId");
            connection_id_ = id.is_string() ? id.get<std::string>() : id.dump();
            logger_->info("Server assigned connection id {}", *connection_id_);
        }
        return;
    }

    if (!opts_.handle_message) {
        logger_->debug("No message handler, dropping message");
        return;
    }
    try {
        opts_.handle_message(result, *this);
    } catch (const std::exception& e) {
        logger_->error("Message handler failed: {}", e.what());
    }
}

void WebSocketClient::schedule_reconnect() {
    std::weak_ptr<int> alive = alive_;
    uint64_t gen = generation_;

    if (reconnect_attempts_ >= opts_.max_reconnect_attempts) {
        logger_->error("Giving up on {} after {} reconnect attempts", raw_url_,
                       reconnect_attempts_);
        state_ = ConnectionState::Disconnected;
        if (opts_.reconnect_cooldown.count() <= 0) return;

        logger_->info("Restarting reconnect cycle in {}ms", opts_.reconnect_cooldown.count());
        reconnect_timer_.expires_after(opts_.reconnect_cooldown);
        reconnect_timer_.async_wait([this, alive, gen](const boost::system::error_code& ec) {
            if (ec || alive.expired() || gen != generation_ || manual_disconnect_) return;
            reconnect_attempts_ = 0;
            state_ = ConnectionState::Reconnecting;
            open_socket();
        });
        return;
    }

    auto delay = next_reconnect_delay(reconnect_attempts_);
    ++reconnect_attempts_;
    state_ = ConnectionState::Reconnecting;
    logger_->info("Reconnecting to {} in {}ms (attempt {}/{})", raw_url_, delay.count(),
                  reconnect_attempts_, opts_.max_reconnect_attempts);

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this, alive, gen](const boost::system::error_code& ec) {
        if (ec || alive.expired() || gen != generation_ || manual_disconnect_) return;
        open_socket();
    });
}

void WebSocketClient::disconnect() {
    manual_disconnect_ = true;
    reconnect_timer_.cancel();
    stop_heartbeat();
    // Anything the old socket reports from here on is stale.
    ++generation_;
    if (socket_) {
        auto socket = std::move(socket_);
        socket->close(close_code::Normal, "Manual disconnect");
    }
    connection_id_.reset();
    state_ = ConnectionState::Disconnected;
    logger_->info("Disconnected from {}", raw_url_);
}

void WebSocketClient::force_reconnect() {
    logger_->info("Forcing reconnect to {}", raw_url_);
    manual_disconnect_ = false;
    reconnect_attempts_ = 0;
    reconnect_timer_.cancel();

    if (socket_ && socket_->ready_state() != ReadyState::Closed) {
        // The resulting close takes the reconnect path.
        socket_->close(close_code::Normal, "Force reconnect");
        return;
    }
    state_ = ConnectionState::Connecting;
    open_socket();
}

void WebSocketClient::start_heartbeat() {
    std::weak_ptr<int> alive = alive_;
    heartbeat_timer_.expires_after(opts_.heartbeat_interval);
    heartbeat_timer_.async_wait([this, alive, gen = generation_](const boost::system::error_code& ec) {
        if (ec || alive.expired() || gen != generation_ ||
            state_ != ConnectionState::Connected) {
            return;
        }
        if (send(nlohmann::json{{"method", "ping"}})) {
            logger_->trace("Heartbeat ping sent");
        } else {
            logger_->warn("Heartbeat ping could not be sent");
        }
        start_heartbeat();
    });
}

void WebSocketClient::stop_heartbeat() {
    heartbeat_timer_.cancel();
}

bool WebSocketClient::send(const nlohmann::json& data, bool use_alternate_stream) {
    if (!data.is_object()) {
        logger_->warn("send() expects a JSON object, got {}", data.type_name());
        return false;
    }

    nlohmann::json message = data;
    message["jsonrpc"] = std::string(JSONRPC_VERSION);
    std::string text;
    try {
        text = message.dump();
    } catch (const nlohmann::json::exception& e) {
        logger_->warn("Cannot serialize outbound message: {}", e.what());
        return false;
    }

    if (use_alternate_stream) {
        return write_alternate(text);
    }
    return primary_writer_->write_frame(text);
}

bool WebSocketClient::write_text(const std::string& text) {
    if (!socket_ || socket_->ready_state() != ReadyState::Open) {
        logger_->debug("Not connected, dropping frame");
        return false;
    }
    try {
        socket_->write(text);
        return true;
    } catch (const TransportError& e) {
        logger_->warn("Write failed: {}", e.what());
        return false;
    }
}

bool WebSocketClient::write_alternate(const std::string& text) {
    if (!alternate_writer_) {
        if (!opts_.stream_writer_factory) {
            logger_->warn("Alternate stream is not supported");
            return false;
        }
        try {
            alternate_writer_ = opts_.stream_writer_factory(url_);
        } catch (const std::exception& e) {
            logger_->error("Failed to set up alternate stream: {}", e.what());
            return false;
        }
        if (!alternate_writer_) {
            logger_->warn("Alternate stream is not supported");
            return false;
        }
    }
    try {
        return alternate_writer_->write_frame(text);
    } catch (const std::exception& e) {
        logger_->error("Alternate stream write failed: {}", e.what());
        return false;
    }
}

void WebSocketClient::send_message(const nlohmann::json& message, const CallContext&) {
    bool sent = message.is_array() ? primary_writer_->write_frame(message.dump())
                                   : send(message);
    if (!sent) {
        throw TransportError("WebSocket is not connected");
    }
}

void WebSocketClient::set_message_handler(ClientMessageHandler handler) {
    opts_.handle_message = std::move(handler);
}

bool WebSocketClient::is_connected() const {
    return state_ == ConnectionState::Connected && socket_ &&
           socket_->ready_state() == ReadyState::Open;
}

ConnectionInfo WebSocketClient::info() const {
    ConnectionInfo out;
    out.url = raw_url_;
    out.connected = is_connected();
    out.connection_id = connection_id_;
    out.client_id = url_.query_param("clientId");
    if (out.client_id.empty() && connection_id_) {
        out.client_id = *connection_id_;
    }
    return out;
}

std::chrono::milliseconds WebSocketClient::next_reconnect_delay(int attempt) const {
    double delay = static_cast<double>(opts_.initial_reconnect_delay.count()) *
                   std::pow(opts_.backoff_factor, std::max(attempt, 0));
    double cap = static_cast<double>(opts_.max_reconnect_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

} // namespace wsrpc
