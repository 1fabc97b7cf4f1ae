#pragma once

#include <mcp_cli/core/cancellation.hpp>
#include <mcp_cli/core/types.hpp>
#include <mcp_cli/process/i_process_supervisor.hpp>
#include <mcp_cli/rpc/call_error.hpp>
#include <mcp_cli/rpc/request_id_allocator.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>

namespace mcp_cli {

struct CallOptions {
    // Overrides the exchange's default response timeout; zero waits forever.
    std::optional<std::chrono::milliseconds> timeout;
    const CancellationToken* cancel = nullptr;
};

// ---------------------------------------------------------------------------
// RequestExchange - one request line out, one response line back.
//
// Calls are serialized by an internal mutex, so at most one request is ever
// in flight on the supervised process. Every TransportError stops the
// process; the next Call() respawns it. Ids keep increasing across restarts.
// ---------------------------------------------------------------------------
class RequestExchange {
public:
    RequestExchange(IProcessSupervisor& supervisor,
                    std::chrono::milliseconds default_timeout = std::chrono::milliseconds(0));

    RequestExchange(const RequestExchange&) = delete;
    RequestExchange& operator=(const RequestExchange&) = delete;

    [[nodiscard]] CallResult<nlohmann::json> Call(const MethodName& method,
                                                  const nlohmann::json& params,
                                                  const CallOptions& options = {});

    // Id of the most recent request, 0 before the first.
    [[nodiscard]] RequestId LastRequestId() const;

private:
    CallResult<nlohmann::json> FailTransport(TransportFailure reason,
                                             std::string message);

    IProcessSupervisor& supervisor_;
    std::chrono::milliseconds default_timeout_;
    RequestIdAllocator ids_;
    mutable std::mutex mutex_;
};

} // namespace mcp_cli
