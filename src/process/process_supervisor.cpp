#include <mcp_cli/process/process_supervisor.hpp>

#include <mcp_cli/core/log.hpp>

#include <algorithm>
#include <thread>

namespace mcp_cli {

namespace {

constexpr std::chrono::milliseconds kStartupSlice{20};
constexpr std::chrono::milliseconds kDrainIdle{100};

std::string StatusText(const std::optional<int>& status) {
    return status.has_value() ? std::to_string(*status) : "unknown";
}

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
}

} // anonymous namespace

const char* ProcessStateName(ProcessState state) {
    switch (state) {
        case ProcessState::NotStarted: return "not_started";
        case ProcessState::Running:    return "running";
        case ProcessState::Exited:     return "exited";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(LaunchSpec spec, SupervisorOptions options)
    : spec_(std::move(spec)), options_(std::move(options)) {}

ProcessSupervisor::~ProcessSupervisor() {
    Stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, StartupError> ProcessSupervisor::EnsureRunning() {
    if (handle_ && handle_->Poll()) {
        return Result<void, StartupError>::Ok();
    }
    if (handle_) {
        LogInfo("supervisor", "server pid " + std::to_string(handle_->Pid()) +
                                  " exited with status " +
                                  StatusText(handle_->ExitStatus()) + ", respawning");
        Retire();
    }
    return SpawnWithRetry();
}

Result<void, StartupError> ProcessSupervisor::Start() {
    Stop();
    return SpawnWithRetry();
}

bool ProcessSupervisor::IsAlive() {
    return handle_ && handle_->Poll();
}

void ProcessSupervisor::Stop() {
    if (!handle_) {
        return;
    }
    const auto pid = handle_->Pid();
    handle_->Terminate(options_.shutdown_grace);
    LogDebug("supervisor", "stopped server pid " + std::to_string(pid) +
                               " (status " + StatusText(handle_->ExitStatus()) + ")");
    Retire();
}

ProcessState ProcessSupervisor::State() const {
    return handle_ ? handle_->State() : state_;
}

std::optional<pid_t> ProcessSupervisor::Pid() const {
    if (!handle_) {
        return std::nullopt;
    }
    return handle_->Pid();
}

void ProcessSupervisor::Retire() {
    // Diagnostics of a retired handle are dropped with it.
    handle_.reset();
    state_ = ProcessState::Exited;
}

Result<void, StartupError> ProcessSupervisor::SpawnWithRetry() {
    auto backoff = options_.startup_backoff;
    for (int attempt = 0;; ++attempt) {
        auto result = SpawnOnce();
        if (result.IsOk() || attempt >= options_.startup_retries) {
            return result;
        }
        LogWarn("supervisor", "startup attempt " + std::to_string(attempt + 1) +
                                  " failed: " + result.Error().message +
                                  "; retrying in " + std::to_string(backoff.count()) + " ms");
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

Result<void, StartupError> ProcessSupervisor::SpawnOnce() {
    auto spawned = ProcessHandle::Spawn(spec_, options_.diagnostics_limit);
    if (spawned.IsErr()) {
        LogError("supervisor", "cannot spawn " + spec_.executable + ": " +
                                   spawned.Error().message);
        return Result<void, StartupError>::Err(std::move(spawned).Error());
    }
    ++spawn_count_;
    auto handle = std::move(spawned).Value();

    auto ready = options_.ready_sentinel.has_value()
                     ? AwaitSentinel(*handle, *options_.ready_sentinel)
                     : AwaitGracePeriod(*handle);
    if (ready.IsErr()) {
        state_ = ProcessState::Exited;
        return ready;  // `handle` reaps the child on scope exit
    }

    LogInfo("supervisor", "server " + spec_.executable + " running (pid " +
                              std::to_string(handle->Pid()) + ")");
    handle_ = std::move(handle);
    return Result<void, StartupError>::Ok();
}

// The server must survive the whole grace period. stderr is pumped meanwhile
// so a chatty startup cannot block on a full pipe.
Result<void, StartupError> ProcessSupervisor::AwaitGracePeriod(ProcessHandle& handle) {
    const auto deadline = std::chrono::steady_clock::now() + options_.grace_period;
    while (true) {
        if (!handle.Poll()) {
            return Result<void, StartupError>::Err(
                FailStartup(handle, "server exited during startup"));
        }
        const auto remaining = Remaining(deadline);
        if (remaining.count() <= 0) {
            return Result<void, StartupError>::Ok();
        }
        const auto slice = std::min(kStartupSlice, remaining);
        if (!handle.PumpDiagnostics(slice)) {
            std::this_thread::sleep_for(slice);
        }
    }
}

// Read stdout lines until the sentinel shows up. Other lines are discarded.
Result<void, StartupError> ProcessSupervisor::AwaitSentinel(ProcessHandle& handle,
                                                            const std::string& sentinel) {
    const auto deadline = std::chrono::steady_clock::now() + options_.grace_period;
    while (true) {
        const auto remaining = Remaining(deadline);
        if (remaining.count() <= 0) {
            return Result<void, StartupError>::Err(FailStartup(
                handle, "ready sentinel not seen within " +
                            std::to_string(options_.grace_period.count()) + " ms"));
        }
        auto read = handle.ReadLine(remaining, nullptr);
        switch (read.status) {
            case ReadStatus::Line: {
                auto line = std::move(read.line);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (line == sentinel) {
                    return Result<void, StartupError>::Ok();
                }
                LogDebug("supervisor", "discarding pre-ready output: " + line);
                break;
            }
            case ReadStatus::Timeout:
            case ReadStatus::Cancelled:
                break;  // deadline check above decides
            case ReadStatus::Eof:
                return Result<void, StartupError>::Err(
                    FailStartup(handle, "server closed stdout before becoming ready"));
            case ReadStatus::IoError:
                return Result<void, StartupError>::Err(
                    FailStartup(handle, "reading server stdout failed: " + read.error));
        }
    }
}

StartupError ProcessSupervisor::FailStartup(ProcessHandle& handle,
                                            const std::string& message) {
    if (handle.Poll()) {
        // Still alive (sentinel timeout): take what is buffered, then stop it.
        handle.PumpDiagnostics(std::chrono::milliseconds(0));
        auto diagnostics = handle.TakeDiagnostics();
        handle.Terminate(options_.shutdown_grace);
        LogError("supervisor", message);
        return StartupError{message, std::move(diagnostics), handle.ExitStatus()};
    }
    handle.DrainDiagnostics(kDrainIdle);
    auto diagnostics = handle.TakeDiagnostics();
    const auto status = handle.ExitStatus();
    handle.Terminate(options_.shutdown_grace);
    const auto full = message + " (exit status " + StatusText(status) + ")";
    LogError("supervisor", full);
    return StartupError{message, std::move(diagnostics), status};
}

// ---------------------------------------------------------------------------
// Line I/O
// ---------------------------------------------------------------------------
Result<void, std::string> ProcessSupervisor::WriteLine(std::string_view line) {
    if (!handle_ || !handle_->Poll()) {
        return Result<void, std::string>::Err("server process is not running");
    }
    return handle_->WriteAll(line);
}

LineRead ProcessSupervisor::ReadLine(std::chrono::milliseconds timeout,
                                     const CancellationToken* cancel) {
    if (!handle_) {
        return LineRead{ReadStatus::Eof, {}, {}};
    }
    auto read = handle_->ReadLine(timeout, cancel);
    if (read.status == ReadStatus::Eof) {
        // The server is going away; collect its last words for the error.
        handle_->DrainDiagnostics(kDrainIdle);
    }
    return read;
}

std::string ProcessSupervisor::TakeDiagnostics() {
    return handle_ ? handle_->TakeDiagnostics() : std::string{};
}

} // namespace mcp_cli
