#include <mcp_cli/cli/output_formatter.hpp>
#include <mcp_cli/core/ansi.hpp>

#include <sstream>

namespace mcp_cli {

namespace {

using namespace mcp_cli::ansi;

// Server diagnostics can be long; show them indented under the message.
void PrintIndented(std::ostream& out, const std::string& text, const char* prefix) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        out << prefix << line << "\n";
    }
}

std::string Dump(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

void OutputFormatter::PrintResult(const nlohmann::json& result) const {
    out_ << Dump(result, json_mode_ ? -1 : 2) << "\n";
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        err_ << kDim << " (" << error.CategoryName() << ")" << kReset << "\n";
        err_ << "  " << error.message << "\n";
        if (error.detail.has_value() && !error.detail->empty()) {
            err_ << "  " << kYellow << "Details:" << kReset << "\n";
            PrintIndented(err_, *error.detail, "    ");
        }
        return;
    }

    err_ << "Error: " << error.operation << " (" << error.CategoryName() << ")\n";
    err_ << "  " << error.message << "\n";
    if (error.detail.has_value() && !error.detail->empty()) {
        err_ << "  Details:\n";
        PrintIndented(err_, *error.detail, "    ");
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace mcp_cli
