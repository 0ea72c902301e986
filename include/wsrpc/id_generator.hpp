#pragma once
#include <functional>
#include <string>

namespace wsrpc {

using IdGenerator = std::function<std::string()>;

/// Random RFC 4122 version 4 UUID, e.g. "3f2b8c1e-9a4d-4e7f-b1c2-0d9e8f7a6b5c".
std::string generate_uuid();

} // namespace wsrpc
