/// Echo peer: connects to a JSON-RPC WebSocket server, serves "echo" and
/// "math.add", and calls "server.info" on every (re)connect.
/// Usage: ./echo_peer ws://localhost:8080/rpc?clientId=demo
/// Set WSRPC_LOG_LEVEL=debug for connection details.

#include <wsrpc/wsrpc.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <csignal>
#include <iostream>
#include <memory>

namespace {

/// Print the outcome of `call` once it settles.
void report_when_ready(boost::asio::steady_timer& timer,
                       std::shared_ptr<wsrpc::OutboundCall> call) {
    using namespace std::chrono_literals;
    if (call->future.wait_for(0ms) != std::future_status::ready) {
        timer.expires_after(50ms);
        timer.async_wait([&timer, call](const boost::system::error_code& ec) {
            if (!ec) report_when_ready(timer, call);
        });
        return;
    }
    try {
        std::cout << "server.info -> " << call->future.get().dump() << "\n";
    } catch (const wsrpc::ProtocolError& e) {
        std::cout << "server.info failed: " << e.what() << " (" << e.code << ")\n";
    } catch (const wsrpc::Error& e) {
        std::cout << "server.info failed: " << e.what() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <ws-url>\n";
        std::cerr << "Example: " << argv[0] << " ws://localhost:8080/rpc\n";
        return 1;
    }

    boost::asio::io_context io;
    boost::asio::steady_timer report_timer(io);
    wsrpc::Engine* engine_ptr = nullptr;

    wsrpc::WebSocketClient::Options copts;
    copts.max_reconnect_attempts = 5;
    copts.reconnect_cooldown = std::chrono::milliseconds(60000);
    copts.on_connected = [&engine_ptr, &report_timer](wsrpc::WebSocketClient& c) {
        std::cout << "Connected to " << c.info().url << "\n";
        if (!engine_ptr) return;
        wsrpc::CallOptions call_opts;
        call_opts.timeout = c.call_timeout();
        auto call = std::make_shared<wsrpc::OutboundCall>(
            engine_ptr->handle_request("server.info", std::nullopt, call_opts));
        report_when_ready(report_timer, call);
    };

    std::unique_ptr<wsrpc::WebSocketClient> client;
    try {
        client = std::make_unique<wsrpc::WebSocketClient>(io, argv[1], std::move(copts));
    } catch (const wsrpc::InvalidUrlError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    wsrpc::Engine engine{io, *client, wsrpc::Engine::Options{}};
    engine_ptr = &engine;

    engine.register_method("echo", [](const nlohmann::json& params, const wsrpc::CallContext&) {
        return params;
    });
    engine.register_method("math.add", [](const nlohmann::json& params, const wsrpc::CallContext&) {
        if (!params.contains("a") || !params.contains("b")) {
            throw wsrpc::ProtocolError(wsrpc::error::InvalidParams, "a and b are required");
        }
        return nlohmann::json(params.at("a").get<double>() + params.at("b").get<double>());
    });

    client->set_message_handler([&engine](const wsrpc::ValidationResult& msg, wsrpc::WebSocketClient&) {
        engine.dispatch(msg);
    });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        std::cout << "Shutting down\n";
        client->disconnect();
        engine.destroy();
        report_timer.cancel();
    });

    client->connect();
    io.run();
    return 0;
}
