#pragma once
#include "../json_rpc.hpp"
#include <optional>
#include <string>

namespace wsrpc {

/// Per-call context handed to method handlers, engine hooks and transports.
struct CallContext {
    /// Opaque transport data supplied by whoever fed the message in (for
    /// example the connection a request arrived on). Echoed back to
    /// ITransport::send_message() so replies reach the same peer.
    nlohmann::json transport;
    /// Method being served; empty for engine-generated messages.
    std::string method;
    /// Id of the request being served; unset for notifications.
    std::optional<RequestId> id;
};

/// Capability the engine writes outbound messages through. `message` is a
/// complete JSON-RPC envelope or a batch array.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual void send_message(const nlohmann::json& message, const CallContext& context) = 0;
};

} // namespace wsrpc
