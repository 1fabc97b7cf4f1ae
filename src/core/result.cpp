#include <mcp_cli/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_cli {

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:     return "config";
        case ErrorCategory::Validation: return "validation";
        case ErrorCategory::Startup:    return "startup";
        case ErrorCategory::Transport:  return "transport";
        case ErrorCategory::Protocol:   return "protocol";
        case ErrorCategory::Tool:       return "tool";
        case ErrorCategory::Internal:   return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        // Diagnostics are usually multi-line; keep the summary on one line.
        auto first_line = detail->substr(0, detail->find('\n'));
        oss << " (" << first_line;
        if (first_line.size() < detail->size()) {
            oss << " ...";
        }
        oss << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    body["message"] = message;
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    body["exit_code"] = ExitCode();
    // Diagnostics may carry arbitrary bytes from the server; never throw here.
    return nlohmann::json{{"error", body}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_cli
