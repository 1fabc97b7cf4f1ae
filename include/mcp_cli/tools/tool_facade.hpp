#pragma once

#include <mcp_cli/core/result.hpp>
#include <mcp_cli/core/types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace mcp_cli {

// A method plus its params object, ready for RequestExchange::Call().
struct ToolRequest {
    MethodName method;
    nlohmann::json params;
};

// ---------------------------------------------------------------------------
// Tool facades - friendly action + keyword arguments -> ToolRequest.
//
// The server's tools take {"action": A, "params": {...}}; search and scrape
// take flat params. `kwargs` must be a JSON object (or null).
// ---------------------------------------------------------------------------

// add    -> add_thought    {content, total_thoughts (default 1)}
// revise -> revise_thought {content, revises_number}
// branch -> branch_thought {content, branch_from, branch_id}
// Other actions are forwarded unchanged with empty params.
Result<ToolRequest, Error> BuildSequentialThinking(const std::string& action,
                                                   const nlohmann::json& kwargs);

Result<ToolRequest, Error> BuildMemory(const std::string& action,
                                       const nlohmann::json& kwargs);

Result<ToolRequest, Error> BuildGraphTool(const std::string& action,
                                          const nlohmann::json& kwargs);

Result<ToolRequest, Error> BuildTaskPlanning(const std::string& action,
                                             const nlohmann::json& kwargs);

Result<ToolRequest, Error> BuildGit(const std::string& action,
                                    const nlohmann::json& kwargs);

// {"query": Q} merged with kwargs (e.g. "count").
Result<ToolRequest, Error> BuildBraveSearch(const std::string& query,
                                            const nlohmann::json& kwargs);

// {"url": U} merged with kwargs.
Result<ToolRequest, Error> BuildScrapeUrl(const std::string& url,
                                          const nlohmann::json& kwargs);

// Arbitrary method with caller-supplied params (the `call` command).
Result<ToolRequest, Error> BuildRawCall(const std::string& method,
                                        const nlohmann::json& params);

} // namespace mcp_cli
