#pragma once

#include <mcp_cli/config/app_config.hpp>
#include <mcp_cli/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcp_cli {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse global CLI options (the ones before the command group).
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// A CLI field still at its built-in default does not override the file.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// ---------------------------------------------------------------------------
// GlobalArgs - argv split at the command group.
//
//   mcp-cli -c cfg.yaml -vv --json think add --content x
//           |-------- global -------| |----- command -----|
//
// `global` keeps argv[0] and only the options LoadFromCli understands; -v,
// -vv, --color and --no-color are consumed by main() and dropped here.
// `command` keeps argv[0] followed by the group and everything after it.
// ---------------------------------------------------------------------------
struct GlobalArgs {
    std::vector<std::string> global;
    std::vector<std::string> command;
};

GlobalArgs SplitGlobalArgs(int argc, const char* const* argv);

} // namespace mcp_cli
