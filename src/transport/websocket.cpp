#include "wsrpc/transport/websocket.hpp"
#include "wsrpc/error.hpp"
#include <algorithm>
#include <cctype>

namespace wsrpc {

const char* to_string(ReadyState state) noexcept {
    switch (state) {
        case ReadyState::Connecting: return "connecting";
        case ReadyState::Open:       return "open";
        case ReadyState::Closing:    return "closing";
        case ReadyState::Closed:     return "closed";
    }
    return "unknown";
}

WebSocketUrl WebSocketUrl::parse(const std::string& url) {
    auto pos = url.find("://");
    if (pos == std::string::npos) {
        throw InvalidUrlError("Invalid WebSocket URL: " + url);
    }

    WebSocketUrl out;
    out.scheme = url.substr(0, pos);
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.scheme != "ws" && out.scheme != "wss") {
        throw InvalidUrlError("Invalid WebSocket URL scheme '" + out.scheme +
                              "', expected ws:// or wss://");
    }

    std::string rest = url.substr(pos + 3);
    auto authority_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, authority_end);
    std::string tail = authority_end == std::string::npos ? "" : rest.substr(authority_end);

    // Drop userinfo.
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw InvalidUrlError("Invalid WebSocket URL host: " + url);
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) port = authority.substr(colon + 1);
    }
    if (out.host.empty()) {
        throw InvalidUrlError("Invalid WebSocket URL, missing host: " + url);
    }
    if (!port.empty() && !std::all_of(port.begin(), port.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidUrlError("Invalid WebSocket URL port: " + url);
    }
    out.port = port.empty() ? (out.secure() ? "443" : "80") : port;

    auto hash = tail.find('#');
    if (hash != std::string::npos) tail = tail.substr(0, hash);
    if (tail.empty() || tail.front() == '?') tail.insert(0, "/");
    out.target = tail;

    auto q = tail.find('?');
    if (q != std::string::npos) out.query = tail.substr(q + 1);
    return out;
}

std::string WebSocketUrl::query_param(const std::string& name) const {
    std::size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        auto eq = pair.find('=');
        if (pair.substr(0, eq) == name) {
            return eq == std::string::npos ? "" : pair.substr(eq + 1);
        }
        start = end + 1;
    }
    return "";
}

} // namespace wsrpc
