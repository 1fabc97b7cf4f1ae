#pragma once

#include <mcp_cli/core/cancellation.hpp>
#include <mcp_cli/core/result.hpp>
#include <mcp_cli/rpc/call_error.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// ProcessState - lifecycle of the supervised server.
//   NotStarted -> Running -> Exited; Exited -> Running only via a new spawn.
// ---------------------------------------------------------------------------
enum class ProcessState {
    NotStarted,
    Running,
    Exited,
};

[[nodiscard]] const char* ProcessStateName(ProcessState state);

enum class ReadStatus {
    Line,
    Eof,
    Timeout,
    Cancelled,
    IoError,
};

// Outcome of waiting for one line on the server's stdout.
struct LineRead {
    ReadStatus status = ReadStatus::Eof;
    std::string line;   // without the trailing '\n' (Line only)
    std::string error;  // errno text (IoError only)
};

// ---------------------------------------------------------------------------
// IProcessSupervisor - owns the server process and its three pipes.
//
// RequestExchange depends on this interface rather than on fork/exec, so the
// exchange can be tested offline with MockProcessSupervisor. The supervisor
// moves bytes; it never parses protocol content.
// ---------------------------------------------------------------------------
class IProcessSupervisor {
public:
    virtual ~IProcessSupervisor() = default;

    IProcessSupervisor(const IProcessSupervisor&) = delete;
    IProcessSupervisor& operator=(const IProcessSupervisor&) = delete;
    IProcessSupervisor(IProcessSupervisor&&) = delete;
    IProcessSupervisor& operator=(IProcessSupervisor&&) = delete;

    // -- Lifecycle -----------------------------------------------------------

    // No-op while the current process is alive; otherwise spawn a new one.
    [[nodiscard]] virtual Result<void, StartupError> EnsureRunning() = 0;

    // Spawn unconditionally, stopping any current process first.
    [[nodiscard]] virtual Result<void, StartupError> Start() = 0;

    // Liveness probe. Observing death moves the state to Exited.
    [[nodiscard]] virtual bool IsAlive() = 0;

    // Terminate and reap the current process, if any.
    virtual void Stop() = 0;

    [[nodiscard]] virtual ProcessState State() const = 0;

    // -- Line I/O ------------------------------------------------------------

    // Write `line` (already '\n'-terminated) to the server's stdin.
    // Fails without writing when the process is not running.
    [[nodiscard]] virtual Result<void, std::string> WriteLine(std::string_view line) = 0;

    // Wait for one line on the server's stdout. A zero timeout waits without
    // bound; `cancel` may be null.
    [[nodiscard]] virtual LineRead ReadLine(std::chrono::milliseconds timeout,
                                            const CancellationToken* cancel) = 0;

    // Everything captured from stderr since the last call, then cleared.
    [[nodiscard]] virtual std::string TakeDiagnostics() = 0;

protected:
    IProcessSupervisor() = default;
};

} // namespace mcp_cli
