#pragma once

#include <mcp_cli/process/i_process_supervisor.hpp>
#include <mcp_cli/process/launch_spec.hpp>
#include <mcp_cli/process/process_handle.hpp>

#include <memory>
#include <optional>

#include <sys/types.h>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// ProcessSupervisor - fork/exec implementation of IProcessSupervisor.
//
// Holds at most one live ProcessHandle. A handle that exited is retired and
// replaced by a fresh spawn on the next EnsureRunning(). The destructor stops
// the server, so it never outlives the supervisor.
// ---------------------------------------------------------------------------
class ProcessSupervisor : public IProcessSupervisor {
public:
    explicit ProcessSupervisor(LaunchSpec spec, SupervisorOptions options = {});
    ~ProcessSupervisor() override;

    [[nodiscard]] Result<void, StartupError> EnsureRunning() override;
    [[nodiscard]] Result<void, StartupError> Start() override;
    [[nodiscard]] bool IsAlive() override;
    void Stop() override;
    [[nodiscard]] ProcessState State() const override;

    [[nodiscard]] Result<void, std::string> WriteLine(std::string_view line) override;
    [[nodiscard]] LineRead ReadLine(std::chrono::milliseconds timeout,
                                    const CancellationToken* cancel) override;
    [[nodiscard]] std::string TakeDiagnostics() override;

    // Number of processes spawned so far (successful fork/exec calls).
    [[nodiscard]] int SpawnCount() const noexcept { return spawn_count_; }

    // Pid of the current handle, if one is held.
    [[nodiscard]] std::optional<pid_t> Pid() const;

    [[nodiscard]] const LaunchSpec& Spec() const noexcept { return spec_; }

private:
    Result<void, StartupError> SpawnWithRetry();
    Result<void, StartupError> SpawnOnce();
    Result<void, StartupError> AwaitGracePeriod(ProcessHandle& handle);
    Result<void, StartupError> AwaitSentinel(ProcessHandle& handle,
                                             const std::string& sentinel);
    StartupError FailStartup(ProcessHandle& handle, const std::string& message);
    void Retire();

    LaunchSpec spec_;
    SupervisorOptions options_;
    std::unique_ptr<ProcessHandle> handle_;
    ProcessState state_ = ProcessState::NotStarted;
    int spawn_count_ = 0;
};

} // namespace mcp_cli
