#pragma once

#include <mcp_cli/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// MethodName - validated JSON-RPC method name.
//
// Rules:
//   - Non-empty, max 128 characters
//   - Printable ASCII only, no whitespace
// ---------------------------------------------------------------------------
class MethodName {
public:
    static Result<MethodName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const MethodName& other) const { return value_ == other.value_; }
    bool operator!=(const MethodName& other) const { return value_ != other.value_; }

    MethodName(const MethodName&) = default;
    MethodName& operator=(const MethodName&) = default;
    MethodName(MethodName&&) noexcept = default;
    MethodName& operator=(MethodName&&) noexcept = default;

private:
    explicit MethodName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace mcp_cli
