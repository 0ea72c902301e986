#include "wsrpc/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>

namespace wsrpc::log {

namespace {

spdlog::level::level_enum level_from_env() {
    const char* value = std::getenv(LEVEL_ENV);
    if (value == nullptr || *value == '\0') return spdlog::level::info;
    auto level = spdlog::level::from_str(value);
    // from_str() maps unknown names to "off"; only honour an explicit "off".
    if (level == spdlog::level::off && std::string(value) != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> make_logger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(level_from_env());
    logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

std::shared_ptr<spdlog::logger> null_logger() {
    static auto logger = std::make_shared<spdlog::logger>("wsrpc-null");
    return logger;
}

std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> logger,
                                           const std::string& name) {
    if (logger) return logger;
    return make_logger(name);
}

} // namespace wsrpc::log
