#include <mcp_cli/cli/command_executor.hpp>
#include <mcp_cli/cli/output_formatter.hpp>
#include <mcp_cli/core/ansi.hpp>
#include <mcp_cli/core/log.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace mcp_cli {

namespace {

using json = nlohmann::json;

// Flags every command accepts; they shape output, not the request.
const std::set<std::string> kOutputFlags = {"json", "color", "no-color", "quiet"};

using RequestBuilder =
    std::function<Result<ToolRequest, Error>(const CommandArgs&, const json&)>;

// One CLI command backed by one tool request.
struct ToolCommand {
    std::string group;
    std::string action;
    std::string description;
    std::vector<ParamSpec> params;
    RequestBuilder build;
    bool takes_positional = false;
    std::string usage;
    std::string args_description;
    std::vector<std::string> examples;
};

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    auto it = args.flags.find(key);
    return (it != args.flags.end()) ? it->second : default_val;
}

Error MakeValidationError(const std::string& message) {
    return Error{"Validation", message, std::nullopt, ErrorCategory::Validation};
}

std::string JoinPositional(const CommandArgs& args) {
    std::string joined;
    for (const auto& p : args.positional) {
        if (!joined.empty()) joined += " ";
        joined += p;
    }
    return joined;
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream in(value);
    std::string item;
    while (std::getline(in, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
    }
    return items;
}

int RunToolCommand(const CommandContext& context, const ToolCommand& command,
                   const CommandArgs& args) {
    const bool json_mode = context.json_output || GetFlag(args, "json") == "true";
    const bool color = context.color && GetFlag(args, "no-color") != "true";
    OutputFormatter fmt(json_mode, color, *context.out, *context.err);

    if (!command.takes_positional && !args.positional.empty()) {
        auto error = MakeValidationError("Unexpected argument '" + args.positional[0] +
                                         "' for '" + command.group + " " +
                                         command.action + "'");
        fmt.PrintError(error);
        return error.ExitCode();
    }

    auto kwargs = BuildKwargs(args, command.params);
    if (kwargs.IsErr()) {
        fmt.PrintError(kwargs.Error());
        return kwargs.Error().ExitCode();
    }

    auto request = command.build(args, kwargs.Value());
    if (request.IsErr()) {
        fmt.PrintError(request.Error());
        return request.Error().ExitCode();
    }

    if (!context.call) {
        Error error{"CommandExecutor", "No server connection configured", std::nullopt,
                    ErrorCategory::Internal};
        fmt.PrintError(error);
        return error.ExitCode();
    }

    LogDebug("cli", command.group + " " + command.action + " -> " +
                        request.Value().method.Value());
    auto result = context.call(request.Value());
    if (result.IsErr()) {
        fmt.PrintError(result.Error());
        return result.Error().ExitCode();
    }

    fmt.PrintResult(result.Value());
    return 0;
}

void RegisterToolCommand(CommandRouter& router, const CommandContext& context,
                         ToolCommand command) {
    CommandHelp help;
    help.usage = command.usage;
    help.args_description = command.args_description;
    help.examples = command.examples;
    for (const auto& p : command.params) {
        help.flags.push_back({p.flag, p.placeholder, p.description, p.required});
    }

    auto group = command.group;
    auto action = command.action;
    auto description = command.description;
    router.Register(group, action, description,
                    [context, command = std::move(command)](const CommandArgs& args) {
                        return RunToolCommand(context, command, args);
                    },
                    std::move(help));
}

// Builders for the "{action, params}" tools: the CLI action maps to a fixed
// server action.
RequestBuilder ActionBuilder(
    Result<ToolRequest, Error> (*facade)(const std::string&, const json&),
    std::string server_action) {
    return [facade, server_action = std::move(server_action)](const CommandArgs&,
                                                              const json& kwargs) {
        return facade(server_action, kwargs);
    };
}

// ---------------------------------------------------------------------------
// think
// ---------------------------------------------------------------------------
void RegisterThinkCommands(CommandRouter& router, const CommandContext& context) {
    router.SetGroupDescription("think", "Sequential thinking: add, revise and branch thoughts");
    router.SetGroupExamples("think", {
        "$ mcp-cli think add --content \"Outline the parser\" --total 3",
        "$ mcp-cli think revise --content \"Use a table-driven lexer\" --revises 2",
        "$ mcp-cli think branch --content \"Try recursive descent\" --branch-from 1 --branch-id alt",
    });

    // Integers are passed through as text; the facade validates them.
    auto think = [](const std::string& action) -> RequestBuilder {
        return [action](const CommandArgs&, const json& kwargs) {
            return BuildSequentialThinking(action, kwargs);
        };
    };

    RegisterToolCommand(router, context, ToolCommand{
        "think", "add", "Add a thought",
        {
            {"content", "content", ParamKind::String, true, "<text>", "Content of the thought"},
            {"total", "total", ParamKind::String, false, "<n>", "Total number of thoughts (default 1)"},
        },
        think("add"), false,
        "mcp-cli think add --content <text> [--total <n>]", "",
        {"mcp-cli think add --content \"First step\" --total 3"},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "think", "revise", "Revise an existing thought",
        {
            {"content", "content", ParamKind::String, true, "<text>", "New content"},
            {"revises", "revises", ParamKind::String, true, "<n>", "Number of the thought to revise"},
        },
        think("revise"), false,
        "mcp-cli think revise --content <text> --revises <n>", "",
        {"mcp-cli think revise --content \"Better first step\" --revises 1"},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "think", "branch", "Branch off an existing thought",
        {
            {"content", "content", ParamKind::String, true, "<text>", "Content of the thought"},
            {"branch-from", "branch_from", ParamKind::String, true, "<n>", "Thought number to branch from"},
            {"branch-id", "branch_id", ParamKind::String, true, "<id>", "Branch identifier"},
        },
        think("branch"), false,
        "mcp-cli think branch --content <text> --branch-from <n> --branch-id <id>", "",
        {"mcp-cli think branch --content \"Alternative\" --branch-from 2 --branch-id alt"},
    });
}

// ---------------------------------------------------------------------------
// memory
// ---------------------------------------------------------------------------
void RegisterMemoryCommands(CommandRouter& router, const CommandContext& context) {
    router.SetGroupDescription("memory", "Memorize, connect and search thoughts");
    router.SetGroupExamples("memory", {
        "$ mcp-cli memory memorize --thought 2 --tags design,parser",
        "$ mcp-cli memory connect --from-thought 1 --to-thought 2 --relation refines",
        "$ mcp-cli memory search --query parser",
    });

    RegisterToolCommand(router, context, ToolCommand{
        "memory", "memorize", "Store a thought in memory",
        {
            {"thought", "thought_number", ParamKind::Integer, true, "<n>", "Thought number to memorize"},
            {"tags", "tags", ParamKind::List, false, "<a,b>", "Comma-separated tags"},
        },
        ActionBuilder(BuildMemory, "memorize_thought"), false,
        "mcp-cli memory memorize --thought <n> [--tags <a,b>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "memory", "connect", "Connect two memorized thoughts",
        {
            {"from-thought", "from_thought", ParamKind::Integer, true, "<n>", "Source thought"},
            {"to-thought", "to_thought", ParamKind::Integer, true, "<n>", "Target thought"},
            {"relation", "relation", ParamKind::String, true, "<name>", "Relation type"},
        },
        ActionBuilder(BuildMemory, "connect_thoughts"), false,
        "mcp-cli memory connect --from-thought <n> --to-thought <n> --relation <name>", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "memory", "search", "Search memorized thoughts",
        {
            {"query", "query", ParamKind::String, true, "<text>", "Search query"},
        },
        ActionBuilder(BuildMemory, "search_memory"), false,
        "mcp-cli memory search --query <text>", "", {},
    });
}

// ---------------------------------------------------------------------------
// graph
// ---------------------------------------------------------------------------
void RegisterGraphCommands(CommandRouter& router, const CommandContext& context) {
    router.SetGroupDescription("graph", "Knowledge graph nodes");
    router.SetGroupExamples("graph", {
        "$ mcp-cli graph create-root --name root --description \"Project\" --content \"...\"",
        "$ mcp-cli graph create-node --name lexer --description Lexer --content \"...\" --parent root",
        "$ mcp-cli --json graph get --name lexer",
    });

    RegisterToolCommand(router, context, ToolCommand{
        "graph", "create-root", "Create the root node",
        {
            {"name", "name", ParamKind::String, true, "<name>", "Node name"},
            {"description", "description", ParamKind::String, true, "<text>", "Node description"},
            {"content", "content", ParamKind::String, true, "<text>", "Node content"},
        },
        ActionBuilder(BuildGraphTool, "create_root"), false,
        "mcp-cli graph create-root --name <name> --description <text> --content <text>", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "graph", "create-node", "Create a node under a parent",
        {
            {"name", "name", ParamKind::String, true, "<name>", "Node name"},
            {"description", "description", ParamKind::String, true, "<text>", "Node description"},
            {"content", "content", ParamKind::String, true, "<text>", "Node content"},
            {"parent", "parent_name", ParamKind::String, true, "<name>", "Parent node name"},
            {"relation", "relation", ParamKind::String, false, "<name>", "Relation to the parent"},
            {"tags", "tags", ParamKind::List, false, "<a,b>", "Comma-separated tags"},
        },
        ActionBuilder(BuildGraphTool, "create_node"), false,
        "mcp-cli graph create-node --name <name> --description <text> --content <text> --parent <name> [flags]",
        "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "graph", "get", "Get a node by name",
        {
            {"name", "node_name", ParamKind::String, true, "<name>", "Node name"},
        },
        ActionBuilder(BuildGraphTool, "get_node"), false,
        "mcp-cli graph get --name <name>", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "graph", "search", "Search nodes",
        {
            {"query", "query", ParamKind::String, true, "<text>", "Search query"},
        },
        ActionBuilder(BuildGraphTool, "search_nodes"), false,
        "mcp-cli graph search --query <text>", "", {},
    });
}

// ---------------------------------------------------------------------------
// task
// ---------------------------------------------------------------------------
void RegisterTaskCommands(CommandRouter& router, const CommandContext& context) {
    router.SetGroupDescription("task", "Task planning");
    router.SetGroupExamples("task", {
        "$ mcp-cli task create --title \"Write lexer\" --description \"...\" --project parser --priority High",
        "$ mcp-cli task update --task-id \"Write lexer\" --status Completed",
        "$ mcp-cli task get --project parser",
    });

    RegisterToolCommand(router, context, ToolCommand{
        "task", "create", "Create a task",
        {
            {"title", "title", ParamKind::String, true, "<text>", "Task title"},
            {"description", "description", ParamKind::String, true, "<text>", "Task description"},
            {"project", "project", ParamKind::String, true, "<name>", "Project name"},
            {"priority", "priority", ParamKind::String, false, "<level>", "Low, Medium, High or Critical"},
            {"tags", "tags", ParamKind::List, false, "<a,b>", "Comma-separated tags"},
        },
        ActionBuilder(BuildTaskPlanning, "create_task"), false,
        "mcp-cli task create --title <text> --description <text> --project <name> [flags]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "task", "update", "Update a task",
        {
            {"task-id", "task_id", ParamKind::String, true, "<id>", "Task identifier"},
            {"status", "status", ParamKind::String, false, "<status>",
             "NotStarted, InProgress, Blocked, Completed or Cancelled"},
            {"priority", "priority", ParamKind::String, false, "<level>", "Low, Medium, High or Critical"},
        },
        ActionBuilder(BuildTaskPlanning, "update_task"), false,
        "mcp-cli task update --task-id <id> [--status <status>] [--priority <level>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "task", "get", "List the tasks of a project",
        {
            {"project", "project", ParamKind::String, true, "<name>", "Project name"},
            {"status", "status", ParamKind::String, false, "<status>", "Only tasks with this status"},
        },
        ActionBuilder(BuildTaskPlanning, "get_project_tasks"), false,
        "mcp-cli task get --project <name> [--status <status>]", "", {},
    });
}

// ---------------------------------------------------------------------------
// git
// ---------------------------------------------------------------------------
void RegisterGitCommands(CommandRouter& router, const CommandContext& context) {
    router.SetGroupDescription("git", "Git repository operations");
    router.SetGroupExamples("git", {
        "$ mcp-cli git init --repo-path ./notes",
        "$ mcp-cli git add --files a.md,b.md --repo-path ./notes",
        "$ mcp-cli git commit --message \"Add notes\" --repo-path ./notes",
    });

    const ParamSpec repo_path{"repo-path", "repo_path", ParamKind::String, false, "<dir>",
                              "Repository directory (server default ./repo)"};

    RegisterToolCommand(router, context, ToolCommand{
        "git", "init", "Initialize a repository",
        {repo_path},
        ActionBuilder(BuildGit, "init_repo"), false,
        "mcp-cli git init [--repo-path <dir>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "git", "add", "Stage files",
        {
            {"files", "files", ParamKind::List, true, "<a,b>", "Comma-separated files to stage"},
            repo_path,
        },
        ActionBuilder(BuildGit, "add_files"), false,
        "mcp-cli git add --files <a,b> [--repo-path <dir>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "git", "commit", "Commit staged changes",
        {
            {"message", "message", ParamKind::String, true, "<text>", "Commit message"},
            repo_path,
        },
        ActionBuilder(BuildGit, "commit_changes"), false,
        "mcp-cli git commit --message <text> [--repo-path <dir>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "git", "status", "Show working tree status",
        {repo_path},
        ActionBuilder(BuildGit, "get_status"), false,
        "mcp-cli git status [--repo-path <dir>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "git", "log", "Show recent commits",
        {
            {"max-count", "max_count", ParamKind::Integer, false, "<n>", "Number of commits (server default 5)"},
            repo_path,
        },
        ActionBuilder(BuildGit, "get_log"), false,
        "mcp-cli git log [--max-count <n>] [--repo-path <dir>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "git", "undo", "Undo the last commit, keeping its changes",
        {repo_path},
        ActionBuilder(BuildGit, "undo_last_commit"), false,
        "mcp-cli git undo [--repo-path <dir>]", "", {},
    });

    RegisterToolCommand(router, context, ToolCommand{
        "git", "push", "Push to a remote",
        {
            {"remote", "remote", ParamKind::String, false, "<name>", "Remote (server default origin)"},
            {"branch", "branch", ParamKind::String, false, "<name>", "Branch (server default main)"},
            repo_path,
        },
        ActionBuilder(BuildGit, "push_changes"), false,
        "mcp-cli git push [--remote <name>] [--branch <name>] [--repo-path <dir>]", "", {},
    });
}

// ---------------------------------------------------------------------------
// search / scrape / call (default actions)
// ---------------------------------------------------------------------------
void RegisterFlatCommands(CommandRouter& router, const CommandContext& context) {
    router.SetGroupDescription("search", "Web search through Brave Search");
    router.SetGroupExamples("search", {
        "$ mcp-cli search \"rust async runtime\" --count 5",
    });
    RegisterToolCommand(router, context, ToolCommand{
        "search", "query", "Search the web",
        {
            {"count", "count", ParamKind::Integer, false, "<n>", "Number of results"},
        },
        [](const CommandArgs& args, const json& kwargs) {
            return BuildBraveSearch(JoinPositional(args), kwargs);
        },
        true,
        "mcp-cli search <query> [--count <n>]",
        "<query>    Search terms (several words are joined with spaces)",
        {"mcp-cli search \"posix spawn\"", "mcp-cli --json search cmake presets --count 3"},
    });
    router.SetDefaultAction("search", "query");

    router.SetGroupDescription("scrape", "Fetch and extract a web page");
    router.SetGroupExamples("scrape", {
        "$ mcp-cli scrape https://example.com",
    });
    RegisterToolCommand(router, context, ToolCommand{
        "scrape", "url", "Scrape a URL",
        {},
        [](const CommandArgs& args, const json& kwargs) {
            if (args.positional.size() > 1) {
                return Result<ToolRequest, Error>::Err(
                    MakeValidationError("scrape takes exactly one URL"));
            }
            return BuildScrapeUrl(args.positional.empty() ? "" : args.positional[0], kwargs);
        },
        true,
        "mcp-cli scrape <url>",
        "<url>    Page to scrape",
        {"mcp-cli scrape https://example.com"},
    });
    router.SetDefaultAction("scrape", "url");

    router.SetGroupDescription("call", "Send a raw request to any server method");
    router.SetGroupExamples("call", {
        "$ mcp-cli call memory --params '{\"action\":\"search_memory\",\"params\":{\"query\":\"x\"}}'",
    });
    RegisterToolCommand(router, context, ToolCommand{
        "call", "method", "Call a method with JSON params",
        {
            {"params", "params", ParamKind::String, false, "<json>", "Params object (default {})"},
        },
        [](const CommandArgs& args, const json& kwargs) {
            if (args.positional.size() != 1) {
                return Result<ToolRequest, Error>::Err(
                    MakeValidationError("call takes exactly one method name"));
            }
            json params = json::object();
            auto it = kwargs.find("params");
            if (it != kwargs.end()) {
                try {
                    params = json::parse(it->get<std::string>());
                } catch (const json::parse_error& e) {
                    return Result<ToolRequest, Error>::Err(
                        MakeValidationError("--params is not valid JSON: " + std::string(e.what())));
                }
            }
            return BuildRawCall(args.positional[0], params);
        },
        true,
        "mcp-cli call <method> [--params <json>]",
        "<method>    Server method name",
        {"mcp-cli call brave_search --params '{\"query\":\"c++\"}'"},
    });
    router.SetDefaultAction("call", "method");
}

// ---------------------------------------------------------------------------
// Help formatting
// ---------------------------------------------------------------------------
struct Ansi {
    std::ostream& out;
    bool color;

    Ansi& Bold(const std::string& s) {
        if (color) out << ansi::kBold;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Dim(const std::string& s) {
        if (color) out << ansi::kDim;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Normal(const std::string& s) {
        out << s;
        return *this;
    }

    Ansi& Nl() {
        out << "\n";
        return *this;
    }
};

void PrintColumns(std::ostream& out, const std::string& left, const std::string& right,
                  size_t width) {
    size_t pad = (width > left.size()) ? (width - left.size()) : 2;
    out << left << std::string(pad, ' ') << right << "\n";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BuildKwargs
// ---------------------------------------------------------------------------
std::string KebabToSnake(const std::string& flag) {
    std::string snake = flag;
    std::replace(snake.begin(), snake.end(), '-', '_');
    return snake;
}

Result<json, Error> BuildKwargs(const CommandArgs& args,
                                const std::vector<ParamSpec>& specs) {
    std::map<std::string, const ParamSpec*> by_flag;
    for (const auto& spec : specs) {
        by_flag[spec.flag] = &spec;
    }

    for (const auto& [flag, value] : args.flags) {
        if (kOutputFlags.count(flag) == 0 && by_flag.count(flag) == 0) {
            return Result<json, Error>::Err(MakeValidationError("Unknown flag --" + flag));
        }
    }

    json kwargs = json::object();
    for (const auto& spec : specs) {
        auto it = args.flags.find(spec.flag);
        if (it == args.flags.end()) {
            if (spec.required) {
                return Result<json, Error>::Err(
                    MakeValidationError("Missing required flag --" + spec.flag));
            }
            continue;
        }
        const auto key = spec.param.empty() ? KebabToSnake(spec.flag) : spec.param;
        const auto& value = it->second;
        switch (spec.kind) {
            case ParamKind::String:
                kwargs[key] = value;
                break;
            case ParamKind::Integer: {
                try {
                    std::size_t consumed = 0;
                    const long long parsed = std::stoll(value, &consumed, 10);
                    if (consumed != value.size()) {
                        throw std::invalid_argument(value);
                    }
                    kwargs[key] = parsed;
                } catch (const std::logic_error&) {
                    return Result<json, Error>::Err(MakeValidationError(
                        "--" + spec.flag + " expects an integer, got '" + value + "'"));
                }
                break;
            }
            case ParamKind::List:
                kwargs[key] = SplitList(value);
                break;
        }
    }
    return Result<json, Error>::Ok(std::move(kwargs));
}

// ---------------------------------------------------------------------------
// RegisterAllCommands
// ---------------------------------------------------------------------------
void RegisterAllCommands(CommandRouter& router, const CommandContext& context) {
    RegisterThinkCommands(router, context);
    RegisterMemoryCommands(router, context);
    RegisterGraphCommands(router, context);
    RegisterTaskCommands(router, context);
    RegisterGitCommands(router, context);
    RegisterFlatCommands(router, context);
}

// ---------------------------------------------------------------------------
// PrintTopLevelHelp
// ---------------------------------------------------------------------------
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color) {
    Ansi a{out, color};
    constexpr size_t kLeft = 34;

    a.Bold("mcp-cli").Normal(" - command line client for a JSON-RPC tool server over stdio").Nl().Nl();
    a.Dim("  Starts the server on first use and talks to it through its stdin/stdout.").Nl();
    a.Dim("  All commands accept --json for machine-readable output.").Nl();

    out << "\n";
    a.Bold("USAGE").Nl();
    out << "  mcp-cli [global-flags] <group> <action> [args] [flags]\n";

    const std::vector<std::string> group_order = {
        "think", "memory", "graph", "task", "search", "scrape", "git", "call"};

    for (const auto& group : group_order) {
        if (!router.HasGroup(group)) {
            continue;
        }
        out << "\n";
        a.Bold(group);
        auto desc = router.GroupDescription(group);
        if (!desc.empty()) {
            a.Dim(" - " + desc);
        }
        a.Nl();
        for (const auto& cmd : router.CommandsForGroup(group)) {
            std::string left = "  " + group + " " + cmd.action;
            if (cmd.help.has_value() && !cmd.help->args_description.empty()) {
                // Default actions read as "search <query>".
                auto arg = cmd.help->args_description.substr(
                    0, cmd.help->args_description.find(' '));
                left = "  " + group + " " + arg;
            }
            PrintColumns(out, left, cmd.description, kLeft);
        }
    }

    out << "\n";
    a.Bold("GLOBAL FLAGS").Nl();
    struct GlobalFlag {
        const char* flag;
        const char* desc;
    };
    const GlobalFlag global_flags[] = {
        {"-c, --config <file>",   "YAML config file"},
        {"--server <path>",       "Server executable (default mcp-server.sh next to mcp-cli)"},
        {"--base-dir <dir>",      "Data directory (default ~/Developer/.mcp)"},
        {"--timeout <sec>",       "Response timeout, 0 waits forever"},
        {"--grace-ms <ms>",       "Startup grace period (default 1000)"},
        {"--log-file <path>",     "Append JSON log lines to a file"},
        {"--json",                "JSON output"},
        {"-q, --quiet",           "Only errors on stderr"},
        {"--color / --no-color",  "Force or disable colored output"},
        {"-v / -vv",              "Info / debug logging"},
        {"--version",             "Print version"},
    };
    for (const auto& gf : global_flags) {
        PrintColumns(out, std::string("  ") + gf.flag, gf.desc, kLeft);
    }

    out << "\n";
    a.Bold("EXIT CODES").Nl();
    out << "  0  Success          2  Config/usage error   3  Server failed to start\n";
    out << "  4  Transport error  5  Protocol error       6  Tool error\n";
    out << "  99 Internal error\n";

    out << "\n";
    a.Dim("  Use \"mcp-cli <group> --help\" for the actions of a group.").Nl();
}

} // namespace mcp_cli
