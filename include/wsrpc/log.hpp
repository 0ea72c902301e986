#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace wsrpc::log {

/// Environment variable read by make_logger() for the initial level.
constexpr const char* LEVEL_ENV = "WSRPC_LOG_LEVEL";

/// Create a stderr logger named `name`. The level comes from WSRPC_LOG_LEVEL
/// (spdlog level names, default "info"). The logger is not registered in
/// spdlog's global registry.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name);

/// Logger without sinks, for callers that want components to stay quiet.
std::shared_ptr<spdlog::logger> null_logger();

/// Returns `logger` if set, otherwise make_logger(name).
std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> logger,
                                           const std::string& name);

} // namespace wsrpc::log
