#include <mcp_cli/config/config_loader.hpp>

#include <mcp_cli/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <string_view>

namespace mcp_cli {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, std::nullopt, ErrorCategory::Config};
}

Error MakeValidationError(const std::string& message) {
    return Error{"ConfigLoader", message, std::nullopt, ErrorCategory::Validation};
}

// Global options that take a value, as spelled on the command line.
bool IsValueOption(std::string_view arg) {
    return arg == "-c" || arg == "--config" || arg == "--server" ||
           arg == "--base-dir" || arg == "--timeout" || arg == "--grace-ms" ||
           arg == "--log-file";
}

// Options main() handles itself; LoadFromCli never sees them.
bool IsMainOnlyOption(std::string_view arg) {
    return arg == "-v" || arg == "-vv" || arg == "--color" ||
           arg == "--no-color" || arg == "--color=true" || arg == "--color=false";
}

void ParseServerNode(const YAML::Node& node, ServerConfig& server) {
    if (node["command"]) {
        server.command = node["command"].as<std::string>();
    }
    if (node["args"]) {
        server.args.clear();
        for (const auto& arg : node["args"]) {
            server.args.push_back(arg.as<std::string>());
        }
    }
    if (node["working_dir"]) {
        server.working_dir = node["working_dir"].as<std::string>();
    }
    if (node["grace_period_ms"]) {
        server.grace_period_ms = node["grace_period_ms"].as<int>();
    }
    if (node["ready_sentinel"]) {
        auto sentinel = node["ready_sentinel"].as<std::string>();
        if (!sentinel.empty()) {
            server.ready_sentinel = std::move(sentinel);
        }
    }
    if (node["startup_retries"]) {
        server.startup_retries = node["startup_retries"].as<int>();
    }
    if (node["startup_backoff_ms"]) {
        server.startup_backoff_ms = node["startup_backoff_ms"].as<int>();
    }
    if (node["shutdown_grace_ms"]) {
        server.shutdown_grace_ms = node["shutdown_grace_ms"].as<int>();
    }
    if (node["response_timeout_seconds"]) {
        server.response_timeout_seconds = node["response_timeout_seconds"].as<int>();
    }
    if (node["log_directive"]) {
        server.log_directive = node["log_directive"].as<std::string>();
    }
    if (node["backtrace"]) {
        server.backtrace = node["backtrace"].as<bool>();
    }
    if (node["env"]) {
        for (const auto& entry : node["env"]) {
            server.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_path = std::string(file_path);

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Server --
        if (root["server"]) {
            ParseServerNode(root["server"], config.server);
        }

        // -- Directories --
        if (root["directories"] && root["directories"]["base_dir"]) {
            config.directories.base_dir =
                root["directories"]["base_dir"].as<std::string>();
        }

        // -- Options --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-cli", kVersion,
                                     argparse::default_arguments::none);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--server")
        .help("Server executable (relative paths resolve next to mcp-cli)");
    program.add_argument("--base-dir")
        .help("Data directory root (default ~/Developer/.mcp)");
    program.add_argument("--timeout")
        .help("Response timeout in seconds (0 waits forever)")
        .scan<'i', int>();
    program.add_argument("--grace-ms")
        .help("Startup grace period in milliseconds")
        .scan<'i', int>();
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        // runtime_error for unknown options, invalid_argument/range for --timeout x
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (auto val = program.present("--server")) {
        config.server.command = *val;
    }
    if (auto val = program.present("--base-dir")) {
        config.directories.base_dir = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.server.response_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--grace-ms")) {
        config.server.grace_period_ms = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const ServerConfig defaults;

    if (cli_overrides.server.command != defaults.command) {
        merged.server.command = cli_overrides.server.command;
    }
    if (cli_overrides.server.grace_period_ms != defaults.grace_period_ms) {
        merged.server.grace_period_ms = cli_overrides.server.grace_period_ms;
    }
    if (cli_overrides.server.response_timeout_seconds !=
        defaults.response_timeout_seconds) {
        merged.server.response_timeout_seconds =
            cli_overrides.server.response_timeout_seconds;
    }
    if (cli_overrides.directories.base_dir.has_value()) {
        merged.directories.base_dir = cli_overrides.directories.base_dir;
    }
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }

    // Options
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& server = config.server;
    if (server.command.empty()) {
        return Result<void, Error>::Err(
            MakeValidationError("Missing required field: server.command"));
    }
    if (server.grace_period_ms < 0) {
        return Result<void, Error>::Err(MakeValidationError(
            "server.grace_period_ms must not be negative, got " +
            std::to_string(server.grace_period_ms)));
    }
    if (server.response_timeout_seconds < 0) {
        return Result<void, Error>::Err(MakeValidationError(
            "Timeout must not be negative, got " +
            std::to_string(server.response_timeout_seconds)));
    }
    if (server.startup_retries < 0) {
        return Result<void, Error>::Err(MakeValidationError(
            "server.startup_retries must not be negative, got " +
            std::to_string(server.startup_retries)));
    }
    if (server.startup_backoff_ms < 0) {
        return Result<void, Error>::Err(MakeValidationError(
            "server.startup_backoff_ms must not be negative, got " +
            std::to_string(server.startup_backoff_ms)));
    }
    if (server.shutdown_grace_ms < 0) {
        return Result<void, Error>::Err(MakeValidationError(
            "server.shutdown_grace_ms must not be negative, got " +
            std::to_string(server.shutdown_grace_ms)));
    }
    for (const auto& [key, value] : server.env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            return Result<void, Error>::Err(
                MakeValidationError("Invalid server.env key: '" + key + "'"));
        }
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeValidationError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// SplitGlobalArgs
// ---------------------------------------------------------------------------
GlobalArgs SplitGlobalArgs(int argc, const char* const* argv) {
    GlobalArgs split;
    if (argc > 0) {
        split.global.emplace_back(argv[0]);
        split.command.emplace_back(argv[0]);
    }

    int i = 1;
    for (; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty() || arg[0] != '-') {
            break;  // first positional: the command group
        }
        if (IsMainOnlyOption(arg) || arg == "--version" ||
            arg == "--help" || arg == "-h") {
            continue;
        }
        split.global.emplace_back(arg);
        if (IsValueOption(arg) && i + 1 < argc) {
            split.global.emplace_back(argv[++i]);
        }
    }
    for (; i < argc; ++i) {
        split.command.emplace_back(argv[i]);
    }
    return split;
}

} // namespace mcp_cli
