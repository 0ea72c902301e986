#pragma once

/// Umbrella header for the wsrpc JSON-RPC over WebSocket library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "id_generator.hpp"
#include "pending_operations.hpp"
#include "engine.hpp"
#include "transport/transport.hpp"
#include "transport/websocket.hpp"
#include "transport/beast_websocket.hpp"
#include "transport/websocket_client.hpp"
