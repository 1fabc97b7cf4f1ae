#include <mcp_cli/tools/tool_facade.hpp>

#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

namespace mcp_cli {

namespace {

using json = nlohmann::json;

Error MakeValidationError(const std::string& operation, const std::string& message) {
    return Error{operation, message, std::nullopt, ErrorCategory::Validation};
}

Result<MethodName, Error> Method(const std::string& name) {
    auto method = MethodName::Create(name);
    if (method.IsErr()) {
        return Result<MethodName, Error>::Err(
            MakeValidationError("ToolFacade", "Invalid method name: " + method.Error()));
    }
    return Result<MethodName, Error>::Ok(std::move(method).Value());
}

Result<json, Error> RequireObject(const std::string& operation, const json& kwargs) {
    if (kwargs.is_null()) {
        return Result<json, Error>::Ok(json::object());
    }
    if (!kwargs.is_object()) {
        return Result<json, Error>::Err(MakeValidationError(
            operation, "Keyword arguments must be a JSON object, got " +
                           std::string(kwargs.type_name())));
    }
    return Result<json, Error>::Ok(kwargs);
}

std::string Trim(const std::string& s) {
    auto begin = s.begin();
    auto end = s.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
    return std::string(begin, end);
}

// JSON integer, integral float, or a decimal string such as "3" or " -2 ".
std::optional<long long> AsInteger(const json& value) {
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            std::fabs(d) < static_cast<double>(std::numeric_limits<long long>::max())) {
            return static_cast<long long>(d);
        }
        return std::nullopt;
    }
    if (value.is_string()) {
        const auto text = Trim(value.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            const long long parsed = std::stoll(text, &consumed, 10);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::logic_error&) {
            // invalid_argument / out_of_range
        }
    }
    return std::nullopt;
}

Result<long long, Error> IntegerArg(const json& kwargs, const std::string& key,
                                    std::optional<long long> fallback) {
    const std::string operation = "sequential_thinking";
    auto it = kwargs.find(key);
    if (it == kwargs.end() || it->is_null()) {
        if (fallback.has_value()) {
            return Result<long long, Error>::Ok(*fallback);
        }
        return Result<long long, Error>::Err(
            MakeValidationError(operation, "Missing required integer '" + key + "'"));
    }
    auto value = AsInteger(*it);
    if (!value.has_value()) {
        return Result<long long, Error>::Err(MakeValidationError(
            operation, "'" + key + "' must be an integer, got " + it->dump()));
    }
    return Result<long long, Error>::Ok(*value);
}

json ValueOrNull(const json& kwargs, const std::string& key) {
    auto it = kwargs.find(key);
    return it == kwargs.end() ? json(nullptr) : *it;
}

// {"action": A, "params": kwargs} for the action-dispatching tools.
Result<ToolRequest, Error> BuildActionRequest(const std::string& method_name,
                                              const std::string& action,
                                              const json& kwargs) {
    if (action.empty()) {
        return Result<ToolRequest, Error>::Err(
            MakeValidationError(method_name, "Missing action"));
    }
    auto params = RequireObject(method_name, kwargs);
    if (params.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(params).Error());
    }
    auto method = Method(method_name);
    if (method.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(method).Error());
    }
    return Result<ToolRequest, Error>::Ok(ToolRequest{
        std::move(method).Value(),
        json{{"action", action}, {"params", std::move(params).Value()}},
    });
}

// {key: value} with kwargs merged on top.
Result<ToolRequest, Error> BuildFlatRequest(const std::string& method_name,
                                            const std::string& key,
                                            const std::string& value,
                                            const json& kwargs) {
    if (value.empty()) {
        return Result<ToolRequest, Error>::Err(
            MakeValidationError(method_name, "Missing " + key));
    }
    auto extra = RequireObject(method_name, kwargs);
    if (extra.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(extra).Error());
    }
    auto method = Method(method_name);
    if (method.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(method).Error());
    }
    json params = {{key, value}};
    params.update(extra.Value());
    return Result<ToolRequest, Error>::Ok(
        ToolRequest{std::move(method).Value(), std::move(params)});
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// sequential_thinking
// ---------------------------------------------------------------------------
Result<ToolRequest, Error> BuildSequentialThinking(const std::string& action,
                                                   const json& kwargs) {
    const std::string method_name = "sequential_thinking";
    if (action.empty()) {
        return Result<ToolRequest, Error>::Err(
            MakeValidationError(method_name, "Missing action"));
    }
    auto checked = RequireObject(method_name, kwargs);
    if (checked.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(checked).Error());
    }
    const auto args = std::move(checked).Value();

    std::string wire_action = action;
    json params = json::object();
    if (action == "add") {
        auto total = IntegerArg(args, "total", 1);
        if (total.IsErr()) {
            return Result<ToolRequest, Error>::Err(std::move(total).Error());
        }
        wire_action = "add_thought";
        params = {{"content", ValueOrNull(args, "content")},
                  {"total_thoughts", total.Value()}};
    } else if (action == "revise") {
        auto revises = IntegerArg(args, "revises", std::nullopt);
        if (revises.IsErr()) {
            return Result<ToolRequest, Error>::Err(std::move(revises).Error());
        }
        wire_action = "revise_thought";
        params = {{"content", ValueOrNull(args, "content")},
                  {"revises_number", revises.Value()}};
    } else if (action == "branch") {
        auto branch_from = IntegerArg(args, "branch_from", std::nullopt);
        if (branch_from.IsErr()) {
            return Result<ToolRequest, Error>::Err(std::move(branch_from).Error());
        }
        wire_action = "branch_thought";
        params = {{"content", ValueOrNull(args, "content")},
                  {"branch_from", branch_from.Value()},
                  {"branch_id", ValueOrNull(args, "branch_id")}};
    }

    auto method = Method(method_name);
    if (method.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(method).Error());
    }
    return Result<ToolRequest, Error>::Ok(ToolRequest{
        std::move(method).Value(),
        json{{"action", wire_action}, {"params", std::move(params)}},
    });
}

// ---------------------------------------------------------------------------
// Action tools
// ---------------------------------------------------------------------------
Result<ToolRequest, Error> BuildMemory(const std::string& action, const json& kwargs) {
    return BuildActionRequest("memory", action, kwargs);
}

Result<ToolRequest, Error> BuildGraphTool(const std::string& action, const json& kwargs) {
    return BuildActionRequest("graph_tool", action, kwargs);
}

Result<ToolRequest, Error> BuildTaskPlanning(const std::string& action,
                                             const json& kwargs) {
    return BuildActionRequest("task_planning", action, kwargs);
}

Result<ToolRequest, Error> BuildGit(const std::string& action, const json& kwargs) {
    return BuildActionRequest("git", action, kwargs);
}

// ---------------------------------------------------------------------------
// Flat tools
// ---------------------------------------------------------------------------
Result<ToolRequest, Error> BuildBraveSearch(const std::string& query, const json& kwargs) {
    return BuildFlatRequest("brave_search", "query", query, kwargs);
}

Result<ToolRequest, Error> BuildScrapeUrl(const std::string& url, const json& kwargs) {
    return BuildFlatRequest("scrape_url", "url", url, kwargs);
}

Result<ToolRequest, Error> BuildRawCall(const std::string& method_name,
                                        const json& params) {
    auto checked = RequireObject("call", params);
    if (checked.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(checked).Error());
    }
    auto method = Method(method_name);
    if (method.IsErr()) {
        return Result<ToolRequest, Error>::Err(std::move(method).Error());
    }
    return Result<ToolRequest, Error>::Ok(
        ToolRequest{std::move(method).Value(), std::move(checked).Value()});
}

} // namespace mcp_cli
