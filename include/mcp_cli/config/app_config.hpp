#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_cli {

constexpr const char* kDefaultServerCommand = "mcp-server.sh";
constexpr const char* kDefaultLogDirective = "web_scrape_mcp=debug,info";

struct ServerConfig {
    std::string command = kDefaultServerCommand;  // relative: next to the mcp-cli binary
    std::vector<std::string> args;
    std::optional<std::string> working_dir;
    int grace_period_ms = 1000;
    std::optional<std::string> ready_sentinel;
    int startup_retries = 1;
    int startup_backoff_ms = 500;
    int shutdown_grace_ms = 2000;
    int response_timeout_seconds = 0;  // 0 = wait forever
    std::string log_directive = kDefaultLogDirective;
    bool backtrace = true;
    std::map<std::string, std::string> env;
};

struct DirectoriesConfig {
    std::optional<std::string> base_dir;  // default: $HOME/Developer/.mcp
};

struct AppConfig {
    ServerConfig server;
    DirectoriesConfig directories;
    std::optional<std::string> config_path;  // -c/--config
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace mcp_cli
