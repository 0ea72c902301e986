#include "wsrpc/transport/beast_websocket.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/log.hpp"
#include "wsrpc/version.hpp"

#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <chrono>
#include <deque>
#include <type_traits>

namespace wsrpc {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(30);

template <class Stream>
class BeastWebSocket final : public IWebSocket,
                             public std::enable_shared_from_this<BeastWebSocket<Stream>> {
    static constexpr bool TLS = std::is_same_v<Stream, TlsStream>;

public:
    BeastWebSocket(net::io_context& io, WebSocketUrl url,
                   std::shared_ptr<spdlog::logger> logger,
                   std::shared_ptr<ssl::context> ssl_ctx)
        : url_(std::move(url))
        , logger_(std::move(logger))
        , ssl_ctx_(std::move(ssl_ctx))
        , resolver_(io)
        , stream_(make_stream(io, ssl_ctx_.get())) {}

    void open(SocketEvents events) override {
        events_ = std::move(events);
        state_ = ReadyState::Connecting;
        logger_->debug("Resolving {}:{}", url_.host, url_.port);
        resolver_.async_resolve(
            url_.host, url_.port,
            beast::bind_front_handler(&BeastWebSocket::on_resolve, this->shared_from_this()));
    }

    ReadyState ready_state() const override { return state_; }

    void write(std::string text) override {
        if (state_ != ReadyState::Open) {
            throw TransportError(std::string("WebSocket is ") + to_string(state_));
        }
        queue_.push_back(std::move(text));
        if (queue_.size() == 1) do_write();
    }

    void close(uint16_t code, const std::string& reason) override {
        switch (state_) {
            case ReadyState::Closing:
            case ReadyState::Closed:
                return;
            case ReadyState::Connecting:
                // The aborted connect step finishes with this code.
                state_ = ReadyState::Closing;
                close_code_ = code;
                close_reason_ = reason;
                resolver_.cancel();
                beast::get_lowest_layer(stream_).cancel();
                return;
            case ReadyState::Open:
                state_ = ReadyState::Closing;
                close_code_ = code;
                close_reason_ = reason;
                stream_.async_close(
                    websocket::close_reason(static_cast<websocket::close_code>(code), reason),
                    beast::bind_front_handler(&BeastWebSocket::on_close, this->shared_from_this()));
                return;
        }
    }

private:
    static Stream make_stream(net::io_context& io, ssl::context* ctx) {
        if constexpr (TLS) {
            return Stream(io, *ctx);
        } else {
            (void)ctx;
            return Stream(io);
        }
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");

        beast::get_lowest_layer(stream_).expires_after(CONNECT_TIMEOUT);
        beast::get_lowest_layer(stream_).async_connect(
            results,
            beast::bind_front_handler(&BeastWebSocket::on_connect, this->shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
        if (ec) return fail(ec, "connect");
        if (state_ != ReadyState::Connecting) {
            return fail(net::error::operation_aborted, "connect");
        }

        beast::error_code opt_ec;
        beast::get_lowest_layer(stream_).socket().set_option(tcp::no_delay(true), opt_ec);
        host_header_ = url_.host + ':' + std::to_string(ep.port());

        if constexpr (TLS) {
            auto& tls = stream_.next_layer();
            if (!::SSL_set_tlsext_host_name(tls.native_handle(), url_.host.c_str())) {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()),
                                         net::error::get_ssl_category()};
                return fail(sni_ec, "ssl sni");
            }
            tls.set_verify_callback(ssl::host_name_verification(url_.host));
            tls.async_handshake(
                ssl::stream_base::client,
                beast::bind_front_handler(&BeastWebSocket::on_ssl_handshake,
                                          this->shared_from_this()));
        } else {
            start_handshake();
        }
    }

    void on_ssl_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "ssl handshake");
        start_handshake();
    }

    void start_handshake() {
        // The websocket stream applies its own timeouts from here on.
        beast::get_lowest_layer(stream_).expires_never();
        stream_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        stream_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, std::string("wsrpc/") + std::string(LIBRARY_VERSION));
        }));
        stream_.text(true);
        stream_.async_handshake(
            host_header_, url_.target,
            beast::bind_front_handler(&BeastWebSocket::on_handshake, this->shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "handshake");
        if (state_ != ReadyState::Connecting) {
            return fail(net::error::operation_aborted, "handshake");
        }

        state_ = ReadyState::Open;
        logger_->debug("WebSocket open: {}{}", host_header_, url_.target);
        do_read();
        if (events_.on_open) events_.on_open();
    }

    void do_read() {
        stream_.async_read(
            buffer_,
            beast::bind_front_handler(&BeastWebSocket::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == websocket::error::closed) {
            const auto& reason = stream_.reason();
            return finish(static_cast<uint16_t>(reason.code),
                          std::string(reason.reason.data(), reason.reason.size()));
        }
        if (ec) return fail(ec, "read");

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (state_ == ReadyState::Closed) return;
        do_read();
        if (events_.on_message) events_.on_message(text);
    }

    void do_write() {
        stream_.async_write(
            net::buffer(queue_.front()),
            beast::bind_front_handler(&BeastWebSocket::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "write");

        queue_.pop_front();
        if (!queue_.empty()) do_write();
    }

    void on_close(beast::error_code ec) {
        if (ec) return fail(ec, "close");
        // The pending read completes with websocket::error::closed.
    }

    void fail(beast::error_code ec, const char* what) {
        if (state_ == ReadyState::Closed) return;

        if (ec == net::error::operation_aborted && state_ == ReadyState::Closing) {
            return finish(close_code_, close_reason_);
        }
        std::string message = std::string(what) + ": " + ec.message();
        logger_->warn("WebSocket {} failed: {}", url_.host, message);
        if (events_.on_error) events_.on_error(message);
        beast::get_lowest_layer(stream_).close();
        finish(close_code::Abnormal, message);
    }

    void finish(uint16_t code, const std::string& reason) {
        if (state_ == ReadyState::Closed) return;
        state_ = ReadyState::Closed;
        queue_.clear();
        logger_->debug("WebSocket closed ({}): {}", code, reason);
        if (events_.on_close) events_.on_close(code, reason);
    }

    WebSocketUrl url_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<ssl::context> ssl_ctx_;
    tcp::resolver resolver_;
    Stream stream_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;
    std::string host_header_;
    SocketEvents events_;
    ReadyState state_{ReadyState::Closed};
    uint16_t close_code_{close_code::Normal};
    std::string close_reason_;
};

} // anonymous namespace

std::shared_ptr<IWebSocket> make_beast_websocket(boost::asio::io_context& io,
                                                 const WebSocketUrl& url,
                                                 std::shared_ptr<spdlog::logger> logger) {
    logger = log::or_default(std::move(logger), "WebSocket");
    if (url.secure()) {
        auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(ssl::verify_peer);
        return std::make_shared<BeastWebSocket<TlsStream>>(io, url, std::move(logger),
                                                          std::move(ctx));
    }
    return std::make_shared<BeastWebSocket<PlainStream>>(io, url, std::move(logger), nullptr);
}

SocketFactory beast_socket_factory(std::shared_ptr<spdlog::logger> logger) {
    return [logger](boost::asio::io_context& io, const WebSocketUrl& url) {
        return make_beast_websocket(io, url, logger);
    };
}

} // namespace wsrpc
