#include <mcp_cli/rpc/call_error.hpp>

namespace mcp_cli {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string DumpPayload(const nlohmann::json& payload) {
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

ErrorKind KindOf(const CallError& error) {
    return std::visit(Overloaded{
        [](const StartupError&) { return ErrorKind::Startup; },
        [](const TransportError&) { return ErrorKind::Transport; },
        [](const ProtocolError&) { return ErrorKind::Protocol; },
        [](const ToolError&) { return ErrorKind::Tool; },
    }, error);
}

const char* KindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Startup:   return "startup";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Protocol:  return "protocol";
        case ErrorKind::Tool:      return "tool";
    }
    return "unknown";
}

const char* TransportFailureName(TransportFailure reason) {
    switch (reason) {
        case TransportFailure::Closed:      return "closed";
        case TransportFailure::Timeout:     return "timeout";
        case TransportFailure::Cancelled:   return "cancelled";
        case TransportFailure::WriteFailed: return "write_failed";
        case TransportFailure::IoError:     return "io_error";
    }
    return "unknown";
}

std::string Describe(const CallError& error) {
    return std::visit(Overloaded{
        [](const StartupError& e) {
            std::string text = "server failed to start: " + e.message;
            if (e.exit_status.has_value()) {
                text += " (exit status " + std::to_string(*e.exit_status) + ")";
            }
            return text;
        },
        [](const TransportError& e) {
            return std::string("transport error (") +
                   TransportFailureName(e.reason) + "): " + e.message;
        },
        [](const ProtocolError& e) {
            return "failed to parse server response: " + e.parse_message;
        },
        [](const ToolError& e) {
            return "tool error: " + DumpPayload(e.payload);
        },
    }, error);
}

Error ToError(const CallError& error, const std::string& method) {
    Error result;
    result.operation = "call " + method;
    result.message = Describe(error);
    std::visit(Overloaded{
        [&result](const StartupError& e) {
            result.category = ErrorCategory::Startup;
            result.detail = e.diagnostics;
        },
        [&result](const TransportError& e) {
            result.category = ErrorCategory::Transport;
            result.detail = e.diagnostics;
        },
        [&result](const ProtocolError& e) {
            result.category = ErrorCategory::Protocol;
            result.detail = "response line: " + e.raw_line;
            if (!e.diagnostics.empty()) {
                *result.detail += "\n" + e.diagnostics;
            }
        },
        [&result](const ToolError& e) {
            result.category = ErrorCategory::Tool;
            result.detail = DumpPayload(e.payload);
        },
    }, error);
    if (result.detail.has_value() && result.detail->empty()) {
        result.detail.reset();
    }
    return result;
}

} // namespace mcp_cli
