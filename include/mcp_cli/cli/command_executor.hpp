#pragma once

#include <mcp_cli/cli/command_router.hpp>
#include <mcp_cli/core/result.hpp>
#include <mcp_cli/tools/tool_facade.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <iosfwd>
#include <iostream>
#include <string>
#include <vector>

namespace mcp_cli {

// Sends one ToolRequest to the server. main() wires this to a lazily started
// ProcessSupervisor + RequestExchange; tests pass a lambda.
using ToolCaller = std::function<Result<nlohmann::json, Error>(const ToolRequest&)>;

struct CommandContext {
    ToolCaller call;
    bool json_output = false;  // global --json or config json_output
    bool color = false;
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
};

// ---------------------------------------------------------------------------
// ParamSpec - how one --flag of a command becomes a request parameter.
//   --branch-from 3   ->  "branch_from": 3      (Integer)
//   --tags a,b        ->  "tags": ["a","b"]     (List)
// ---------------------------------------------------------------------------
enum class ParamKind {
    String,
    Integer,
    List,
};

struct ParamSpec {
    std::string flag;         // without "--"
    std::string param;        // key in the request params
    ParamKind kind = ParamKind::String;
    bool required = false;
    std::string placeholder;  // e.g. "<n>"
    std::string description;
};

// "branch-from" -> "branch_from"
std::string KebabToSnake(const std::string& flag);

// Convert the flags of `args` into a params object according to `specs`.
// Output flags (--json, --color, --no-color, --quiet) are ignored; any other
// unknown flag, a missing required flag or a non-numeric Integer is a
// validation Error.
Result<nlohmann::json, Error> BuildKwargs(const CommandArgs& args,
                                          const std::vector<ParamSpec>& specs);

// Register every tool command (think, memory, graph, task, search, scrape,
// git, call) with the router.
void RegisterAllCommands(CommandRouter& router, const CommandContext& context);

// Print top-level help (all groups, global flags, exit codes).
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color);

} // namespace mcp_cli
