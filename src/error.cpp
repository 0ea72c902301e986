#include "wsrpc/error.hpp"

namespace wsrpc::error {

const char* standard_message(int code) noexcept {
    switch (code) {
        case ParseError:          return "Parse error";
        case InvalidRequest:      return "Invalid Request";
        case MethodNotFound:      return "Method not found";
        case InvalidParams:       return "Invalid params";
        case InternalError:       return "Internal error";
        case TimeoutError:        return "Request timeout";
        case ConnectionError:     return "Connection error";
        case AuthenticationError: return "Authentication required";
        case AuthorizationError:  return "Authorization failed";
        case RateLimitError:      return "Rate limit exceeded";
        case ValidationError:     return "Validation error";
        default: break;
    }
    if (code >= ServerErrorStart && code <= ServerErrorEnd) return "Server error";
    return "Unknown error";
}

} // namespace wsrpc::error
