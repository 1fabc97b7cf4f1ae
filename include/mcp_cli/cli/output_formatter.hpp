#pragma once

#include <mcp_cli/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// OutputFormatter - human-readable and JSON output for CLI commands.
//
// Results go to `out`, errors to `err`. In JSON mode everything is a single
// compact JSON document per line; otherwise results are indented and errors
// use a multi-line layout, with ANSI colors when color_mode is set.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // A tool result: compact in JSON mode, indent 2 otherwise.
    void PrintResult(const nlohmann::json& result) const;

    // Print a raw JSON string to stdout.
    void PrintJson(const std::string& json) const;

    // Print an error to stderr.
    void PrintError(const Error& error) const;

    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace mcp_cli
