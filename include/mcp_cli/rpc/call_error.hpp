#pragma once

#include <mcp_cli/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// The four ways a call to the server can fail. Each carries only the payload
// that is meaningful for its kind; callers pattern-match on CallError.
// ---------------------------------------------------------------------------

// The server could not be spawned, or exited before its readiness window
// closed. `diagnostics` is everything it wrote to stderr.
struct StartupError {
    std::string message;
    std::string diagnostics;
    std::optional<int> exit_status;
};

enum class TransportFailure {
    Closed,       // output stream hit EOF before a response line
    Timeout,      // no response line within the call timeout
    Cancelled,    // the caller's CancellationToken fired
    WriteFailed,  // request line could not be written (broken pipe, ...)
    IoError,      // read(2)/poll(2) failed
};

struct TransportError {
    TransportFailure reason = TransportFailure::Closed;
    std::string message;
    std::string diagnostics;
};

// A response line that is not a JSON object.
struct ProtocolError {
    std::string raw_line;
    std::string parse_message;
    std::string diagnostics;
};

// A well-formed response carrying an `error` member, kept verbatim.
struct ToolError {
    nlohmann::json payload;
};

using CallError = std::variant<StartupError, TransportError, ProtocolError, ToolError>;

enum class ErrorKind {
    Startup,
    Transport,
    Protocol,
    Tool,
};

[[nodiscard]] ErrorKind KindOf(const CallError& error);

[[nodiscard]] const char* KindName(ErrorKind kind);

[[nodiscard]] const char* TransportFailureName(TransportFailure reason);

// One-line human readable summary, e.g. "transport error (timeout): ...".
[[nodiscard]] std::string Describe(const CallError& error);

// Lift into the application-wide Error (operation = "call <method>").
[[nodiscard]] Error ToError(const CallError& error, const std::string& method);

template <typename T>
using CallResult = Result<T, CallError>;

} // namespace mcp_cli
