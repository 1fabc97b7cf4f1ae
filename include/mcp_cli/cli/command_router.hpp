#pragma once

#include <mcp_cli/core/result.hpp>

#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// CommandArgs - parsed command-line arguments for a specific command.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                        // e.g. "think", "graph", "search"
    std::string action;                       // e.g. "add", "create-node"
    std::vector<std::string> positional;      // remaining positional arguments
    std::map<std::string, std::string> flags; // --key=value pairs
};

// Returns 0 on success, the error's exit code on failure.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "branch-from"
    std::string placeholder; // e.g. "<n>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;             // e.g. "mcp-cli think add --content <text> [--total <n>]"
    std::string args_description;
    std::string long_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter - two-level dispatch for CLI commands.
//
// Commands are registered as group/action pairs. The router parses argv,
// extracts the group and action, and dispatches to the registered handler.
//
// Usage:
//   CommandRouter router;
//   router.Register("think", "add", "Add a thought", handler);
//   return router.Dispatch(argc, argv);
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler);

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  CommandHelp help);

    void SetGroupDescription(const std::string& group,
                             const std::string& description);

    void SetGroupExamples(const std::string& group,
                          std::vector<std::string> examples);

    // When the parsed action doesn't match any registered action, the default
    // action is used instead and the parsed "action" token is prepended to
    // the positional args.
    // Example: "mcp-cli search rust" -> search:query with positional[0]="rust"
    void SetDefaultAction(const std::string& group, const std::string& action);

    // Parse argv and dispatch to the matching handler.
    // Returns the handler's exit code, or 2 on routing error.
    // Intercepts --help/-h at group and command levels.
    int Dispatch(int argc, const char* const* argv,
                 std::ostream& out, std::ostream& err) const;
    int Dispatch(int argc, const char* const* argv) const;

    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // True if arg is a flag that never consumes the next token (--json, ...).
    static bool IsBooleanFlag(std::string_view arg);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;
    [[nodiscard]] std::vector<std::string> GroupExamples(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group,
                          const std::string& action,
                          std::ostream& out) const;

private:
    // Key: "group:action"
    std::map<std::string, CommandInfo> commands_;
    std::map<std::string, std::string> group_descriptions_;
    std::map<std::string, std::vector<std::string>> group_examples_;
    std::map<std::string, std::string> default_actions_;
};

} // namespace mcp_cli
