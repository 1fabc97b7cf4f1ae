#include <catch2/catch_test_macros.hpp>

#include <mcp_cli/cli/command_executor.hpp>
#include <mcp_cli/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace mcp_cli;
using json = nlohmann::json;

namespace {

// Routes commands with a fake server call that records the request.
struct Harness {
    Harness() {
        CommandContext context;
        context.call = [this](const ToolRequest& request) -> Result<json, Error> {
            last.emplace(request);
            ++calls;
            if (failure.has_value()) {
                return Result<json, Error>::Err(*failure);
            }
            return Result<json, Error>::Ok(reply);
        };
        context.out = &out;
        context.err = &err;
        RegisterAllCommands(router, context);
    }

    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    int Run(std::vector<const char*> argv) {
        argv.insert(argv.begin(), "mcp-cli");
        return router.Dispatch(static_cast<int>(argv.size()), argv.data(), out, err);
    }

    const json& Params() const { return last->params; }
    std::string Method() const { return last->method.Value(); }

    CommandRouter router;
    std::ostringstream out;
    std::ostringstream err;
    std::optional<ToolRequest> last;
    int calls = 0;
    json reply = json{{"ok", true}};
    std::optional<Error> failure;
};

CommandArgs MakeArgs(std::map<std::string, std::string> flags) {
    CommandArgs args;
    args.group = "g";
    args.action = "a";
    args.flags = std::move(flags);
    return args;
}

} // namespace

// ===========================================================================
// KebabToSnake / BuildKwargs
// ===========================================================================

TEST_CASE("KebabToSnake: replaces dashes", "[cli][executor]") {
    CHECK(KebabToSnake("branch-from") == "branch_from");
    CHECK(KebabToSnake("max-count") == "max_count");
    CHECK(KebabToSnake("query") == "query");
}

TEST_CASE("BuildKwargs: converts flags by kind", "[cli][executor]") {
    const std::vector<ParamSpec> specs = {
        {"name", "node_name", ParamKind::String, true, "<name>", ""},
        {"max-count", "", ParamKind::Integer, false, "<n>", ""},
        {"tags", "tags", ParamKind::List, false, "<a,b>", ""},
    };
    auto result = BuildKwargs(
        MakeArgs({{"name", "lexer"}, {"max-count", "7"}, {"tags", "a, b ,,c"}}), specs);
    REQUIRE(result.IsOk());
    const auto& kwargs = result.Value();
    CHECK(kwargs["node_name"] == "lexer");
    CHECK(kwargs["max_count"] == 7);
    CHECK(kwargs["tags"] == json::array({"a", "b", "c"}));
}

TEST_CASE("BuildKwargs: absent optional flags are omitted", "[cli][executor]") {
    const std::vector<ParamSpec> specs = {
        {"remote", "remote", ParamKind::String, false, "<name>", ""},
    };
    auto result = BuildKwargs(MakeArgs({}), specs);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == json::object());
}

TEST_CASE("BuildKwargs: validation errors", "[cli][executor]") {
    const std::vector<ParamSpec> specs = {
        {"thought", "thought_number", ParamKind::Integer, true, "<n>", ""},
    };

    SECTION("missing required flag") {
        auto result = BuildKwargs(MakeArgs({}), specs);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Missing required flag --thought");
        CHECK(result.Error().category == ErrorCategory::Validation);
    }
    SECTION("unknown flag") {
        auto result = BuildKwargs(MakeArgs({{"thought", "1"}, {"bogus", "x"}}), specs);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Unknown flag --bogus");
    }
    SECTION("non-numeric integer") {
        auto result = BuildKwargs(MakeArgs({{"thought", "3x"}}), specs);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "--thought expects an integer, got '3x'");
        CHECK(result.Error().ExitCode() == 2);
    }
    SECTION("output flags are ignored") {
        auto result = BuildKwargs(
            MakeArgs({{"thought", "1"}, {"json", "true"}, {"no-color", "true"}}), specs);
        REQUIRE(result.IsOk());
        CHECK(result.Value().size() == 1);
    }
}

// ===========================================================================
// Tool commands through the router
// ===========================================================================

TEST_CASE("think add: sends add_thought", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"think", "add", "--content", "Outline", "--total", "3"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Method() == "sequential_thinking");
    CHECK(h.Params()["action"] == "add_thought");
    CHECK(h.Params()["params"]["content"] == "Outline");
    CHECK(h.Params()["params"]["total_thoughts"] == 3);
    CHECK(json::parse(h.out.str()) == json{{"ok", true}});
}

TEST_CASE("think branch: maps kebab flags", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"think", "branch", "--content", "Alt", "--branch-from", "2",
                 "--branch-id", "alt"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Params()["action"] == "branch_thought");
    CHECK(h.Params()["params"]["branch_from"] == 2);
    CHECK(h.Params()["params"]["branch_id"] == "alt");
}

TEST_CASE("think revise: bad number never reaches the server", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"think", "revise", "--content", "x", "--revises", "two"}) == 2);
    CHECK(h.calls == 0);
    CHECK(h.err.str().find("revises") != std::string::npos);
}

TEST_CASE("memory memorize: integer and list params", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"memory", "memorize", "--thought", "4", "--tags", "design,parser"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Method() == "memory");
    CHECK(h.Params()["action"] == "memorize_thought");
    CHECK(h.Params()["params"]["thought_number"] == 4);
    CHECK(h.Params()["params"]["tags"] == json::array({"design", "parser"}));
}

TEST_CASE("graph create-node: parent flag renamed", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"graph", "create-node", "--name", "lexer", "--description", "Lexer",
                 "--content", "c", "--parent", "root"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Method() == "graph_tool");
    CHECK(h.Params()["action"] == "create_node");
    CHECK(h.Params()["params"]["parent_name"] == "root");
    CHECK_FALSE(h.Params()["params"].contains("relation"));
}

TEST_CASE("task create: missing required flag is a usage error", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"task", "create", "--title", "t", "--description", "d"}) == 2);
    CHECK(h.calls == 0);
    CHECK(h.err.str().find("Missing required flag --project") != std::string::npos);
}

TEST_CASE("git add: files become a list", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"git", "add", "--files", "a.md,b.md", "--repo-path", "./notes"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Method() == "git");
    CHECK(h.Params()["action"] == "add_files");
    CHECK(h.Params()["params"]["files"] == json::array({"a.md", "b.md"}));
    CHECK(h.Params()["params"]["repo_path"] == "./notes");
}

TEST_CASE("git log: max-count is an integer", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"git", "log", "--max-count", "3"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Params()["action"] == "get_log");
    CHECK(h.Params()["params"]["max_count"] == 3);
}

TEST_CASE("git init: stray positional is rejected", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"git", "init", "extra"}) == 2);
    CHECK(h.calls == 0);
    CHECK(h.err.str().find("Unexpected argument 'extra'") != std::string::npos);
}

TEST_CASE("search: positionals are joined into one query", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"search", "rust", "async", "--count", "5"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Method() == "brave_search");
    CHECK(h.Params()["query"] == "rust async");
    CHECK(h.Params()["count"] == 5);
}

TEST_CASE("scrape: one URL", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"scrape", "https://example.com"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Method() == "scrape_url");
    CHECK(h.Params()["url"] == "https://example.com");

    Harness two;
    CHECK(two.Run({"scrape", "https://a", "https://b"}) == 2);
    CHECK(two.calls == 0);
}

TEST_CASE("call: raw method with JSON params", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"call", "memory", "--params", R"({"action":"search_memory"})"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Method() == "memory");
    CHECK(h.Params() == json{{"action", "search_memory"}});
}

TEST_CASE("call: params default to an empty object", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"call", "ping"}) == 0);
    REQUIRE(h.last.has_value());
    CHECK(h.Params() == json::object());
}

TEST_CASE("call: invalid JSON params", "[cli][executor]") {
    Harness h;
    CHECK(h.Run({"call", "memory", "--params", "{not json"}) == 2);
    CHECK(h.calls == 0);
    CHECK(h.err.str().find("not valid JSON") != std::string::npos);
}

// ===========================================================================
// Output and errors
// ===========================================================================

TEST_CASE("Tool error: exit 6 with message on stderr", "[cli][executor]") {
    Harness h;
    h.failure = Error{"call git", "not a git repository", std::nullopt, ErrorCategory::Tool};
    CHECK(h.Run({"git", "status"}) == 6);
    CHECK(h.out.str().empty());
    CHECK(h.err.str().find("not a git repository") != std::string::npos);
}

TEST_CASE("Startup error: exit 3 with diagnostics", "[cli][executor]") {
    Harness h;
    h.failure = Error{"call memory", "server exited during startup",
                      std::string("missing BRAVE_API_KEY"), ErrorCategory::Startup};
    CHECK(h.Run({"memory", "search", "--query", "x"}) == 3);
    CHECK(h.err.str().find("missing BRAVE_API_KEY") != std::string::npos);
}

TEST_CASE("--json: compact result and JSON errors", "[cli][executor]") {
    Harness h;
    h.reply = json{{"nodes", json::array({1, 2})}};
    CHECK(h.Run({"graph", "search", "--query", "x", "--json"}) == 0);
    CHECK(h.out.str() == "{\"nodes\":[1,2]}\n");

    Harness bad;
    CHECK(bad.Run({"graph", "get", "--json"}) == 2);
    auto j = json::parse(bad.err.str());
    CHECK(j["error"]["category"] == "validation");
}

TEST_CASE("Missing server connection is an internal error", "[cli][executor]") {
    CommandRouter router;
    std::ostringstream out, err;
    CommandContext context;
    context.out = &out;
    context.err = &err;
    RegisterAllCommands(router, context);

    const char* argv[] = {"mcp-cli", "git", "status"};
    CHECK(router.Dispatch(3, argv, out, err) == 99);
}

// ===========================================================================
// Help
// ===========================================================================

TEST_CASE("Every registered command has usage help", "[cli][executor][help]") {
    CommandRouter router;
    RegisterAllCommands(router, CommandContext{});
    for (const auto& group : router.Groups()) {
        CHECK_FALSE(router.GroupDescription(group).empty());
        for (const auto& cmd : router.CommandsForGroup(group)) {
            INFO(group << " " << cmd.action);
            REQUIRE(cmd.help.has_value());
            CHECK(cmd.help->usage.rfind("mcp-cli " + group, 0) == 0);
            CHECK_FALSE(cmd.description.empty());
        }
    }
}

TEST_CASE("Command help marks required flags", "[cli][executor][help]") {
    Harness h;
    CHECK(h.Run({"task", "update", "--help"}) == 0);
    CHECK(h.calls == 0);
    CHECK(h.out.str().find("--task-id <id>") != std::string::npos);
    CHECK(h.out.str().find("(required)") != std::string::npos);
}

TEST_CASE("PrintTopLevelHelp: groups, flags and exit codes", "[cli][executor][help]") {
    CommandRouter router;
    RegisterAllCommands(router, CommandContext{});
    std::ostringstream out;
    PrintTopLevelHelp(router, out, false);

    auto text = out.str();
    for (const char* group : {"think", "memory", "graph", "task", "search", "scrape",
                              "git", "call"}) {
        CHECK(text.find(std::string("\n") + group) != std::string::npos);
    }
    CHECK(text.find("search <query>") != std::string::npos);
    CHECK(text.find("GLOBAL FLAGS") != std::string::npos);
    CHECK(text.find("EXIT CODES") != std::string::npos);
    CHECK(text.find("\033[") == std::string::npos);
}

TEST_CASE("PrintTopLevelHelp: color adds ANSI codes", "[cli][executor][help]") {
    CommandRouter router;
    RegisterAllCommands(router, CommandContext{});
    std::ostringstream out;
    PrintTopLevelHelp(router, out, true);
    CHECK(out.str().find("\033[") != std::string::npos);
}
