#pragma once

#include <mcp_cli/config/app_config.hpp>
#include <mcp_cli/core/result.hpp>
#include <mcp_cli/process/launch_spec.hpp>

#include <map>
#include <string>
#include <string_view>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// DataDirectories - the per-user tree the server writes into.
//
//   <base>/               default $HOME/Developer/.mcp
//   <base>/logs
//   <base>/knowledge_graph
//   <base>/thoughts
// ---------------------------------------------------------------------------
struct DataDirectories {
    std::string base;
    std::string logs;
    std::string knowledge_graph;
    std::string thoughts;
};

// Replace a leading "~" or "~/" with $HOME. Other paths are returned as-is.
std::string ExpandHome(std::string_view path);

// Layout rooted at `base_dir`, or at the default when absent.
Result<DataDirectories, Error> ResolveDataDirectories(
    const std::optional<std::string>& base_dir);

// Create every directory of the layout that does not exist yet.
Result<void, Error> EnsureDirectories(const DataDirectories& dirs);

// RUST_LOG, RUST_BACKTRACE, LOG_DIR, KNOWLEDGE_GRAPH_DIR, THOUGHTS_DIR, then
// server.env on top.
std::map<std::string, std::string> ServerEnvironment(const DataDirectories& dirs,
                                                     const ServerConfig& server);

// Absolute commands are used as-is; relative ones resolve against the
// directory of the running mcp-cli executable.
Result<std::string, Error> ResolveServerExecutable(const std::string& command);

Result<LaunchSpec, Error> BuildLaunchSpec(const AppConfig& config,
                                          const DataDirectories& dirs);

SupervisorOptions BuildSupervisorOptions(const ServerConfig& server);

} // namespace mcp_cli
