#include <catch2/catch_test_macros.hpp>

#include <mcp_cli/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace mcp_cli;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests are run from the build directory; testdata is relative to project root.
// Use __FILE__ to get the absolute path of this test file and derive testdata path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);           // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

std::vector<const char*> ToArgv(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    for (const auto& a : args) {
        argv.push_back(a.c_str());
    }
    return argv;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    const auto& server = config.server;

    CHECK(server.command == "/opt/mcp/bin/web-scrape-mcp");
    REQUIRE(server.args.size() == 2);
    CHECK(server.args[0] == "--stdio");
    CHECK(server.args[1] == "--no-banner");
    REQUIRE(server.working_dir.has_value());
    CHECK(*server.working_dir == "/opt/mcp");
    CHECK(server.grace_period_ms == 1500);
    REQUIRE(server.ready_sentinel.has_value());
    CHECK(*server.ready_sentinel == "READY");
    CHECK(server.startup_retries == 3);
    CHECK(server.startup_backoff_ms == 250);
    CHECK(server.shutdown_grace_ms == 500);
    CHECK(server.response_timeout_seconds == 30);
    CHECK(server.log_directive == "web_scrape_mcp=info");
    CHECK_FALSE(server.backtrace);
    REQUIRE(server.env.size() == 2);
    CHECK(server.env.at("BRAVE_API_KEY") == "test-key");

    REQUIRE(config.directories.base_dir.has_value());
    CHECK(*config.directories.base_dir == "/var/lib/mcp");
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/mcp-cli.log");
    CHECK(config.json_output);
    REQUIRE(config.config_path.has_value());
    CHECK(*config.config_path == TestDataPath("valid_config.yaml"));
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& server = result.Value().server;

    CHECK(server.command == "./my-server");
    CHECK(server.args.empty());
    CHECK(server.grace_period_ms == 1000);
    CHECK_FALSE(server.ready_sentinel.has_value());
    CHECK(server.startup_retries == 1);
    CHECK(server.response_timeout_seconds == 0);
    CHECK(server.log_directive == "web_scrape_mcp=debug,info");
    CHECK(server.backtrace);
    CHECK_FALSE(result.Value().directories.base_dir.has_value());
}

TEST_CASE("LoadFromYaml: empty sentinel means no sentinel", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("empty_sentinel_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().server.ready_sentinel.has_value());
}

TEST_CASE("LoadFromYaml: errors", "[config][yaml]") {
    SECTION("nonexistent file") {
        auto result = LoadFromYaml("/nonexistent/path/config.yaml");
        REQUIRE(result.IsErr());
        CHECK(result.Error().operation == "ConfigLoader");
        CHECK(result.Error().category == ErrorCategory::Config);
        CHECK(result.Error().ExitCode() == 2);
    }
    SECTION("malformed YAML") {
        auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("YAML") != std::string::npos);
    }
    SECTION("wrong value type") {
        auto result = LoadFromYaml(TestDataPath("bad_types_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no options gives defaults", "[config][cli]") {
    const char* argv[] = {"mcp-cli"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().server.command == "mcp-server.sh");
    CHECK_FALSE(result.Value().json_output);
    CHECK_FALSE(result.Value().config_path.has_value());
}

TEST_CASE("LoadFromCli: all options", "[config][cli]") {
    const char* argv[] = {
        "mcp-cli",
        "-c", "/etc/mcp.yaml",
        "--server", "/usr/local/bin/mcp",
        "--base-dir", "/data/mcp",
        "--timeout", "45",
        "--grace-ms", "250",
        "--log-file", "/tmp/cli.log",
        "--json",
        "-q",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(*config.config_path == "/etc/mcp.yaml");
    CHECK(config.server.command == "/usr/local/bin/mcp");
    CHECK(*config.directories.base_dir == "/data/mcp");
    CHECK(config.server.response_timeout_seconds == 45);
    CHECK(config.server.grace_period_ms == 250);
    CHECK(*config.log_file == "/tmp/cli.log");
    CHECK(config.json_output);
    CHECK(config.quiet);
}

TEST_CASE("LoadFromCli: bad input is a config error", "[config][cli]") {
    SECTION("unknown option") {
        const char* argv[] = {"mcp-cli", "--frobnicate"};
        auto result = LoadFromCli(2, argv);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("non-numeric timeout") {
        const char* argv[] = {"mcp-cli", "--timeout", "soon"};
        auto result = LoadFromCli(3, argv);
        REQUIRE(result.IsErr());
        CHECK(result.Error().ExitCode() == 2);
    }
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml")).Value();
    AppConfig cli;
    cli.server.command = "/bin/other";
    cli.server.response_timeout_seconds = 5;
    cli.directories.base_dir = "/cli/base";

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.server.command == "/bin/other");
    CHECK(merged.server.response_timeout_seconds == 5);
    CHECK(*merged.directories.base_dir == "/cli/base");
    // Not settable on the command line: kept from the file.
    CHECK(merged.server.startup_retries == 3);
    CHECK(merged.server.env.at("BRAVE_API_KEY") == "test-key");
}

TEST_CASE("MergeConfigs: CLI defaults do not override YAML", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml")).Value();
    AppConfig cli;

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.server.command == "/opt/mcp/bin/web-scrape-mcp");
    CHECK(merged.server.grace_period_ms == 1500);
    CHECK(merged.server.response_timeout_seconds == 30);
    CHECK(*merged.directories.base_dir == "/var/lib/mcp");
    CHECK(merged.json_output);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad values", "[config][validate]") {
    AppConfig config;
    SECTION("empty command") {
        config.server.command = "";
    }
    SECTION("negative grace period") {
        config.server.grace_period_ms = -1;
    }
    SECTION("negative timeout") {
        config.server.response_timeout_seconds = -5;
    }
    SECTION("negative retries") {
        config.server.startup_retries = -1;
    }
    SECTION("env key with '='") {
        config.server.env["A=B"] = "x";
    }
    SECTION("verbose and quiet") {
        config.verbose = true;
        config.quiet = true;
    }
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Validation);
    CHECK(result.Error().ExitCode() == 2);
}

// ===========================================================================
// SplitGlobalArgs
// ===========================================================================

TEST_CASE("SplitGlobalArgs: splits at the group", "[config][split]") {
    std::vector<std::string> args = {"mcp-cli", "-c", "cfg.yaml", "-vv", "--json",
                                     "think", "add", "--content", "x"};
    auto argv = ToArgv(args);
    auto split = SplitGlobalArgs(static_cast<int>(argv.size()), argv.data());

    CHECK(split.global == std::vector<std::string>{"mcp-cli", "-c", "cfg.yaml", "--json"});
    CHECK(split.command ==
          std::vector<std::string>{"mcp-cli", "think", "add", "--content", "x"});
}

TEST_CASE("SplitGlobalArgs: value options consume the next token", "[config][split]") {
    std::vector<std::string> args = {"mcp-cli", "--server", "srv", "--timeout", "5",
                                     "search", "rust"};
    auto argv = ToArgv(args);
    auto split = SplitGlobalArgs(static_cast<int>(argv.size()), argv.data());

    CHECK(split.global ==
          std::vector<std::string>{"mcp-cli", "--server", "srv", "--timeout", "5"});
    CHECK(split.command == std::vector<std::string>{"mcp-cli", "search", "rust"});
}

TEST_CASE("SplitGlobalArgs: main-only flags are dropped", "[config][split]") {
    std::vector<std::string> args = {"mcp-cli", "-v", "--no-color", "--color", "git", "init"};
    auto argv = ToArgv(args);
    auto split = SplitGlobalArgs(static_cast<int>(argv.size()), argv.data());

    CHECK(split.global == std::vector<std::string>{"mcp-cli"});
    CHECK(split.command == std::vector<std::string>{"mcp-cli", "git", "init"});
}

TEST_CASE("SplitGlobalArgs: flags after the group stay with the command", "[config][split]") {
    std::vector<std::string> args = {"mcp-cli", "memory", "search", "--json", "--query", "q"};
    auto argv = ToArgv(args);
    auto split = SplitGlobalArgs(static_cast<int>(argv.size()), argv.data());

    CHECK(split.global == std::vector<std::string>{"mcp-cli"});
    CHECK(split.command.size() == 6);
}
