#pragma once

#include <mcp_cli/core/types.hpp>
#include <mcp_cli/rpc/call_error.hpp>
#include <mcp_cli/rpc/request_id_allocator.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcp_cli {

constexpr const char* kJsonRpcVersion = "2.0";

// ---------------------------------------------------------------------------
// Wire codec for the line-delimited JSON-RPC exchange.
//
//   request : {"jsonrpc":"2.0","method":M,"params":{...},"id":N}\n
//   response: {"result":{...}} | {"error":<any>} | {}
// ---------------------------------------------------------------------------

// Serialize one request as a single '\n'-terminated line. `params` must be an
// object; null is sent as {}. Anything else is a caller bug and is reported as
// a ProtocolError before any byte reaches the server.
[[nodiscard]] Result<std::string, ProtocolError> EncodeRequest(
    const MethodName& method,
    const nlohmann::json& params,
    RequestId id);

// Parse one response line (with or without its trailing newline).
//   malformed / not an object -> ProtocolError{raw line, parser message, diagnostics}
//   has "error"               -> ToolError{payload verbatim}; "result" ignored
//   otherwise                 -> "result", or {} when absent
[[nodiscard]] CallResult<nlohmann::json> DecodeResponse(
    std::string_view line,
    const std::string& diagnostics = {});

} // namespace mcp_cli
