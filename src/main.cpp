#include <mcp_cli/cli/command_executor.hpp>
#include <mcp_cli/cli/command_router.hpp>
#include <mcp_cli/cli/output_formatter.hpp>
#include <mcp_cli/config/config_loader.hpp>
#include <mcp_cli/core/log.hpp>
#include <mcp_cli/core/terminal.hpp>
#include <mcp_cli/core/version.hpp>
#include <mcp_cli/process/process_supervisor.hpp>
#include <mcp_cli/rpc/request_exchange.hpp>
#include <mcp_cli/workspace/data_directories.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

// Resolve color mode for help output (stdout-based, before logger init).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color" || arg == "--color=true") force_color = true;
        if (arg == "--no-color" || arg == "--color=false") force_no_color = true;
    }
    return mcp_cli::ResolveColor(force_color, force_no_color, mcp_cli::IsStdoutTty());
}

// Check for --version before the first positional (group) argument.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "mcp-cli " << mcp_cli::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// --help/-h before the group prints top-level help. After the group the
// router prints group or command help.
bool HasHelpFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--help" || arg == "-h") return true;
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// ---------------------------------------------------------------------------
// ServerClient - starts the server on the first tool call and keeps it for
// the rest of the process. Destruction stops the server.
// ---------------------------------------------------------------------------
class ServerClient {
public:
    explicit ServerClient(mcp_cli::AppConfig config) : config_(std::move(config)) {}

    mcp_cli::Result<nlohmann::json, mcp_cli::Error> Call(const mcp_cli::ToolRequest& request) {
        using namespace mcp_cli;
        auto ready = Connect();
        if (ready.IsErr()) {
            return Result<nlohmann::json, Error>::Err(ready.Error());
        }

        auto result = exchange_->Call(request.method, request.params);
        if (result.IsErr()) {
            return Result<nlohmann::json, Error>::Err(
                ToError(result.Error(), request.method.Value()));
        }
        return Result<nlohmann::json, Error>::Ok(std::move(result).Value());
    }

private:
    mcp_cli::Result<void, mcp_cli::Error> Connect() {
        using namespace mcp_cli;
        if (exchange_) {
            return Result<void, Error>::Ok();
        }

        auto dirs = ResolveDataDirectories(config_.directories.base_dir);
        if (dirs.IsErr()) {
            return Result<void, Error>::Err(dirs.Error());
        }
        auto created = EnsureDirectories(dirs.Value());
        if (created.IsErr()) {
            return created;
        }
        auto spec = BuildLaunchSpec(config_, dirs.Value());
        if (spec.IsErr()) {
            return Result<void, Error>::Err(spec.Error());
        }

        LogInfo("main", "Server: " + spec.Value().executable);
        LogDebug("main", "Data directory: " + dirs.Value().base);

        supervisor_ = std::make_unique<ProcessSupervisor>(
            std::move(spec).Value(), BuildSupervisorOptions(config_.server));
        exchange_ = std::make_unique<RequestExchange>(
            *supervisor_,
            std::chrono::seconds(config_.server.response_timeout_seconds));
        return Result<void, Error>::Ok();
    }

    mcp_cli::AppConfig config_;
    std::unique_ptr<mcp_cli::ProcessSupervisor> supervisor_;
    std::unique_ptr<mcp_cli::RequestExchange> exchange_;
};

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_cli;

    // No arguments: print top-level help.
    if (argc == 1) {
        CommandRouter router;
        RegisterAllCommands(router, CommandContext{});
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto split = SplitGlobalArgs(argc, argv);
    if (HasHelpFlag(argc, argv) && split.command.size() <= 1) {
        CommandRouter router;
        RegisterAllCommands(router, CommandContext{});
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    // Parse verbosity and color flags.
    auto log_level = LogLevel::Warn;
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (!arg.empty() && arg[0] != '-') break;
        if (arg == "-vv") { log_level = LogLevel::Debug; }
        else if (arg == "-v")  { log_level = LogLevel::Info; }
        else if (arg == "--color" || arg == "--color=true") { force_color = true; }
        else if (arg == "--no-color" || arg == "--color=false") { force_no_color = true; }
    }
    const bool log_color = ResolveColor(force_color, force_no_color, IsStderrTty());
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(log_color), log_level);

    // CLI options, then the YAML file underneath them.
    std::vector<const char*> global_argv;
    for (const auto& token : split.global) {
        global_argv.push_back(token.c_str());
    }
    auto cli_result = LoadFromCli(static_cast<int>(global_argv.size()), global_argv.data());
    if (cli_result.IsErr()) {
        OutputFormatter(false, log_color).PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto config = std::move(cli_result).Value();
    config.verbose = log_level != LogLevel::Warn;

    if (config.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_path);
        if (yaml_result.IsErr()) {
            OutputFormatter(config.json_output, log_color).PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        OutputFormatter(config.json_output, log_color).PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Final logger: level from config, optional JSON log file beside the console.
    if (config.quiet) {
        log_level = LogLevel::Error;
    } else if (config.verbose && log_level == LogLevel::Warn) {
        log_level = LogLevel::Info;
    }
    std::unique_ptr<ILogSink> sink = std::make_unique<ColorConsoleSink>(log_color);
    if (config.log_file.has_value()) {
        auto file_sink = std::make_unique<FileSink>(*config.log_file);
        if (!file_sink->IsOpen()) {
            Error error{"Logging", "Cannot open log file: " + *config.log_file,
                        std::nullopt, ErrorCategory::Config};
            OutputFormatter(config.json_output, log_color).PrintError(error);
            return error.ExitCode();
        }
        sink = std::make_unique<TeeSink>(std::move(sink), std::move(file_sink));
    }
    InitGlobalLogger(std::move(sink), log_level);

    if (config.config_path.has_value()) {
        LogDebug("main", "Config: " + *config.config_path);
    }

    ServerClient client(config);
    CommandContext context;
    context.call = [&client](const ToolRequest& request) { return client.Call(request); };
    context.json_output = config.json_output;
    context.color = ResolveColor(force_color, force_no_color, IsStdoutTty());

    CommandRouter router;
    RegisterAllCommands(router, context);

    std::vector<const char*> command_argv;
    for (const auto& token : split.command) {
        command_argv.push_back(token.c_str());
    }
    return router.Dispatch(static_cast<int>(command_argv.size()), command_argv.data());
}
