#pragma once

#include <mcp_cli/core/cancellation.hpp>
#include <mcp_cli/core/result.hpp>
#include <mcp_cli/process/i_process_supervisor.hpp>
#include <mcp_cli/process/launch_spec.hpp>
#include <mcp_cli/rpc/call_error.hpp>

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// ProcessHandle - one spawned server process and its pipes (POSIX).
//
// Owns the pid and the parent ends of stdin/stdout/stderr. Destruction kills
// and reaps a still-running child and closes every descriptor, so a handle
// can never leak a process. Once Exited, a handle refuses writes; restarting
// means spawning a new handle.
// ---------------------------------------------------------------------------
class ProcessHandle {
public:
    [[nodiscard]] static Result<std::unique_ptr<ProcessHandle>, StartupError> Spawn(
        const LaunchSpec& spec,
        std::size_t diagnostics_limit);

    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&&) = delete;
    ProcessHandle& operator=(ProcessHandle&&) = delete;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    [[nodiscard]] ProcessState State() const noexcept { return state_; }

    // Exit code, or 128 + signal number for a signalled child.
    [[nodiscard]] std::optional<int> ExitStatus() const noexcept { return exit_status_; }

    // Non-blocking waitpid. Returns true while the child is running.
    bool Poll();

    // Write all of `data` to the child's stdin, retrying short writes.
    [[nodiscard]] Result<void, std::string> WriteAll(std::string_view data);

    // Wait for one complete line on stdout, pumping stderr meanwhile.
    // At EOF a trailing partial line is returned as a Line.
    [[nodiscard]] LineRead ReadLine(std::chrono::milliseconds timeout,
                                    const CancellationToken* cancel);

    // Read whatever stderr has buffered, waiting at most `wait` for the first
    // byte. Returns false once stderr reached EOF.
    bool PumpDiagnostics(std::chrono::milliseconds wait);

    // Read stderr until EOF or until it stays silent for `idle`.
    void DrainDiagnostics(std::chrono::milliseconds idle);

    // Buffered stderr, prefixed with "[... N bytes dropped]" when the cap
    // discarded older output.
    [[nodiscard]] std::string TakeDiagnostics();

    // Close stdin, wait `grace`, SIGTERM, wait `grace`, SIGKILL; always reaps.
    void Terminate(std::chrono::milliseconds grace);

private:
    ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                  std::size_t diagnostics_limit);

    void AppendDiagnostics(const char* data, std::size_t size);
    bool WaitForExit(std::chrono::milliseconds timeout);
    void CloseStdin();
    void CloseAll();

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    ProcessState state_ = ProcessState::Running;
    std::optional<int> exit_status_;
    std::string stdout_buffer_;
    std::string diagnostics_;
    std::size_t diagnostics_limit_;
    std::size_t diagnostics_seen_ = 0;     // total bytes ever appended
    std::size_t diagnostics_dropped_ = 0;  // dropped by the cap since the last Take
};

} // namespace mcp_cli
