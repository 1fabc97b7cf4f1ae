#include <mcp_cli/core/types.hpp>

#include <algorithm>

namespace mcp_cli {

namespace {

// Printable ASCII excluding space.
bool IsMethodChar(char c) {
    return c > ' ' && c < 0x7f;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// MethodName
// ---------------------------------------------------------------------------
Result<MethodName, std::string> MethodName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<MethodName, std::string>::Err("Method name must not be empty");
    }
    if (name.size() > 128) {
        return Result<MethodName, std::string>::Err(
            "Method name must be at most 128 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsMethodChar)) {
        return Result<MethodName, std::string>::Err(
            "Method name must contain only printable ASCII characters without whitespace");
    }
    return Result<MethodName, std::string>::Ok(MethodName(std::string(name)));
}

} // namespace mcp_cli
