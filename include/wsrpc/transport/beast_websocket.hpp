#pragma once
#include "websocket.hpp"
#include <memory>

namespace wsrpc {

/// Create a Boost.Beast backed socket for `url`: plain TCP for ws://, TLS
/// with peer and host name verification for wss://.
std::shared_ptr<IWebSocket> make_beast_websocket(boost::asio::io_context& io,
                                                 const WebSocketUrl& url,
                                                 std::shared_ptr<spdlog::logger> logger = nullptr);

/// SocketFactory producing make_beast_websocket() sockets that log to `logger`.
SocketFactory beast_socket_factory(std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace wsrpc
