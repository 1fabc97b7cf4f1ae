#include <mcp_cli/workspace/data_directories.hpp>

#include <mcp_cli/core/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace mcp_cli {

namespace fs = std::filesystem;

namespace {

Error MakeWorkspaceError(const std::string& message,
                         std::optional<std::string> detail = std::nullopt) {
    return Error{"Workspace", message, std::move(detail), ErrorCategory::Config};
}

std::optional<std::string> HomeDirectory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::nullopt;
    }
    return std::string(home);
}

} // anonymous namespace

std::string ExpandHome(std::string_view path) {
    if (path.empty() || path[0] != '~') {
        return std::string(path);
    }
    if (path.size() > 1 && path[1] != '/') {
        return std::string(path);  // ~user is not supported
    }
    auto home = HomeDirectory();
    if (!home) {
        return std::string(path);
    }
    return *home + std::string(path.substr(1));
}

Result<DataDirectories, Error> ResolveDataDirectories(
    const std::optional<std::string>& base_dir) {
    std::string base;
    if (base_dir.has_value() && !base_dir->empty()) {
        base = ExpandHome(*base_dir);
    } else {
        auto home = HomeDirectory();
        if (!home) {
            return Result<DataDirectories, Error>::Err(MakeWorkspaceError(
                "HOME is not set; pass --base-dir or set directories.base_dir"));
        }
        base = (fs::path(*home) / "Developer" / ".mcp").string();
    }

    const fs::path root(base);
    return Result<DataDirectories, Error>::Ok(DataDirectories{
        base,
        (root / "logs").string(),
        (root / "knowledge_graph").string(),
        (root / "thoughts").string(),
    });
}

Result<void, Error> EnsureDirectories(const DataDirectories& dirs) {
    for (const auto* dir : {&dirs.base, &dirs.logs, &dirs.knowledge_graph, &dirs.thoughts}) {
        std::error_code ec;
        if (fs::create_directories(*dir, ec)) {
            LogDebug("workspace", "created " + *dir);
        }
        if (ec) {
            return Result<void, Error>::Err(
                MakeWorkspaceError("Cannot create directory " + *dir, ec.message()));
        }
        if (!fs::is_directory(*dir, ec)) {
            return Result<void, Error>::Err(
                MakeWorkspaceError(*dir + " exists but is not a directory"));
        }
    }
    return Result<void, Error>::Ok();
}

std::map<std::string, std::string> ServerEnvironment(const DataDirectories& dirs,
                                                     const ServerConfig& server) {
    std::map<std::string, std::string> env;
    env["RUST_LOG"] = server.log_directive;
    if (server.backtrace) {
        env["RUST_BACKTRACE"] = "1";
    }
    env["LOG_DIR"] = dirs.logs;
    env["KNOWLEDGE_GRAPH_DIR"] = dirs.knowledge_graph;
    env["THOUGHTS_DIR"] = dirs.thoughts;
    for (const auto& [key, value] : server.env) {
        env[key] = value;
    }
    return env;
}

Result<std::string, Error> ResolveServerExecutable(const std::string& command) {
    const fs::path path(ExpandHome(command));
    if (path.is_absolute()) {
        return Result<std::string, Error>::Ok(path.string());
    }

    std::error_code ec;
    const auto self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return Result<std::string, Error>::Err(MakeWorkspaceError(
            "Cannot locate the mcp-cli executable to resolve " + command,
            ec.message()));
    }
    return Result<std::string, Error>::Ok(
        (self.parent_path() / path).lexically_normal().string());
}

Result<LaunchSpec, Error> BuildLaunchSpec(const AppConfig& config,
                                          const DataDirectories& dirs) {
    auto executable = ResolveServerExecutable(config.server.command);
    if (executable.IsErr()) {
        return Result<LaunchSpec, Error>::Err(std::move(executable).Error());
    }

    LaunchSpec spec;
    spec.executable = std::move(executable).Value();
    spec.args = config.server.args;
    spec.env = ServerEnvironment(dirs, config.server);
    if (config.server.working_dir.has_value()) {
        spec.working_dir = ExpandHome(*config.server.working_dir);
    }
    return Result<LaunchSpec, Error>::Ok(std::move(spec));
}

SupervisorOptions BuildSupervisorOptions(const ServerConfig& server) {
    SupervisorOptions options;
    options.grace_period = std::chrono::milliseconds(server.grace_period_ms);
    options.ready_sentinel = server.ready_sentinel;
    options.startup_retries = server.startup_retries;
    options.startup_backoff = std::chrono::milliseconds(server.startup_backoff_ms);
    options.shutdown_grace = std::chrono::milliseconds(server.shutdown_grace_ms);
    return options;
}

} // namespace mcp_cli
