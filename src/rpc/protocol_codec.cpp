#include <mcp_cli/rpc/protocol_codec.hpp>

namespace mcp_cli {

Result<std::string, ProtocolError> EncodeRequest(
    const MethodName& method,
    const nlohmann::json& params,
    RequestId id) {
    if (!params.is_null() && !params.is_object()) {
        return Result<std::string, ProtocolError>::Err(ProtocolError{
            "", "request params must be a JSON object, got " +
                    std::string(params.type_name()),
            ""});
    }

    nlohmann::json request = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method.Value()},
        {"params", params.is_null() ? nlohmann::json::object() : params},
        {"id", id},
    };

    // dump() with no indent never emits a raw newline: control characters in
    // strings are escaped, so the request stays on one line.
    std::string line;
    try {
        line = request.dump();
    } catch (const nlohmann::json::type_error& e) {
        // Invalid UTF-8 in a string value.
        return Result<std::string, ProtocolError>::Err(
            ProtocolError{"", e.what(), ""});
    }
    line.push_back('\n');
    return Result<std::string, ProtocolError>::Ok(std::move(line));
}

CallResult<nlohmann::json> DecodeResponse(std::string_view line,
                                          const std::string& diagnostics) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        return CallResult<nlohmann::json>::Err(
            ProtocolError{std::string(line), e.what(), diagnostics});
    }

    if (!response.is_object()) {
        return CallResult<nlohmann::json>::Err(ProtocolError{
            std::string(line),
            "expected a JSON object, got " + std::string(response.type_name()),
            diagnostics});
    }

    auto error_it = response.find("error");
    if (error_it != response.end()) {
        return CallResult<nlohmann::json>::Err(ToolError{*error_it});
    }

    auto result_it = response.find("result");
    if (result_it == response.end()) {
        return CallResult<nlohmann::json>::Ok(nlohmann::json::object());
    }
    return CallResult<nlohmann::json>::Ok(*result_it);
}

} // namespace mcp_cli
