#pragma once
#include <string_view>

namespace mcphost {

constexpr std::string_view LIBRARY_VERSION   = "0.1.0";
constexpr std::string_view CLIENT_NAME       = "mcphost";
constexpr std::string_view JSONRPC_VERSION   = "2.0";
constexpr std::string_view CAPABILITY_METHOD = "mcp.getCapabilities";

} // namespace mcphost
