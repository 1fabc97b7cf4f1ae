#include <mcp_cli/process/process_handle.hpp>

#include <mcp_cli/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <map>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_cli {

namespace {

constexpr std::chrono::milliseconds kPollSlice{50};
constexpr std::chrono::milliseconds kReapInterval{10};
constexpr std::size_t kReadChunk = 4096;

std::string ErrnoText(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Blocks SIGPIPE in the calling thread for one write to the server, so a
// server that died since the last liveness probe surfaces as EPIPE instead of
// killing the client. The process-wide disposition is left alone. A SIGPIPE
// raised by our own write is consumed before the mask is restored.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        was_pending_ = sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        blocked_ = pthread_sigmask(SIG_BLOCK, &sigpipe_, &previous_) == 0;
    }

    ~ScopedSigpipeBlock() {
        if (!blocked_) {
            return;
        }
        if (broken_pipe_ && !was_pending_) {
            const timespec zero{0, 0};
            while (sigtimedwait(&sigpipe_, nullptr, &zero) < 0 && errno == EINTR) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

    void NoteBrokenPipe() noexcept { broken_pipe_ = true; }

private:
    sigset_t sigpipe_;
    sigset_t previous_;
    bool was_pending_ = false;
    bool blocked_ = false;
    bool broken_pipe_ = false;
};

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool SetNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Parent environment with `overrides` applied. Built before fork() because
// the child may only make async-signal-safe calls.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string_view entry(*e);
        const auto key = std::string(entry.substr(0, entry.find('=')));
        if (overrides.count(key) == 0) {
            entries.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> ToCArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

void WriteToStderr(const char* text) {
    const auto len = std::strlen(text);
    ssize_t ignored = ::write(STDERR_FILENO, text, len);
    (void)ignored;
}

// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(int stdin_fd, int stdout_fd, int stderr_fd,
                            char* const argv[], char* const envp[],
                            const char* working_dir) {
    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0) {
        _exit(127);
    }
    // The pipe ends were created O_CLOEXEC; dup2 clears the flag on 0/1/2 only.
    if (working_dir != nullptr && chdir(working_dir) != 0) {
        WriteToStderr("mcp-cli: cannot enter server working directory ");
        WriteToStderr(working_dir);
        WriteToStderr("\n");
        _exit(126);
    }
    execve(argv[0], argv, envp);
    WriteToStderr("mcp-cli: cannot execute server ");
    WriteToStderr(argv[0]);
    WriteToStderr(errno == ENOENT ? ": no such file\n" : ": exec failed\n");
    _exit(127);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ProcessHandle>, StartupError> ProcessHandle::Spawn(
    const LaunchSpec& spec,
    std::size_t diagnostics_limit) {
    using SpawnResult = Result<std::unique_ptr<ProcessHandle>, StartupError>;

    if (spec.executable.empty()) {
        return SpawnResult::Err(
            StartupError{"no server executable configured", "", std::nullopt});
    }

    std::vector<std::string> argv_strings;
    argv_strings.push_back(spec.executable);
    argv_strings.insert(argv_strings.end(), spec.args.begin(), spec.args.end());
    auto env_strings = BuildEnvironment(spec.env);
    auto argv = ToCArray(argv_strings);
    auto envp = ToCArray(env_strings);
    const char* working_dir =
        spec.working_dir.has_value() ? spec.working_dir->c_str() : nullptr;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    auto close_pipes = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (pipe2(in_pipe, O_CLOEXEC) != 0 ||
        pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0) {
        auto message = ErrnoText("cannot create server pipes");
        close_pipes();
        return SpawnResult::Err(StartupError{message, "", std::nullopt});
    }

    const pid_t pid = fork();
    if (pid < 0) {
        auto message = ErrnoText("fork failed");
        close_pipes();
        return SpawnResult::Err(StartupError{message, "", std::nullopt});
    }
    if (pid == 0) {
        ExecChild(in_pipe[0], out_pipe[1], err_pipe[1],
                  argv.data(), envp.data(), working_dir);
    }

    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    if (!SetNonBlocking(out_pipe[0]) || !SetNonBlocking(err_pipe[0])) {
        LogWarn("supervisor", ErrnoText("cannot make server pipes non-blocking"));
    }

    LogDebug("supervisor", "spawned " + spec.executable + " (pid " +
                               std::to_string(pid) + ")");
    return SpawnResult::Ok(std::unique_ptr<ProcessHandle>(new ProcessHandle(
        pid, in_pipe[1], out_pipe[0], err_pipe[0], diagnostics_limit)));
}

ProcessHandle::ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd,
                             int stderr_fd, std::size_t diagnostics_limit)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      diagnostics_limit_(diagnostics_limit) {}

ProcessHandle::~ProcessHandle() {
    if (state_ == ProcessState::Running) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        state_ = ProcessState::Exited;
    }
    CloseAll();
}

// ---------------------------------------------------------------------------
// Liveness
// ---------------------------------------------------------------------------
bool ProcessHandle::Poll() {
    if (state_ != ProcessState::Running) {
        return false;
    }
    int status = 0;
    const pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r < 0 && errno == EINTR) {
        return true;
    }
    if (r == pid_) {
        exit_status_ = DecodeWaitStatus(status);
    }
    // r < 0 with ECHILD: someone else reaped it; either way it is gone.
    state_ = ProcessState::Exited;
    CloseStdin();
    return false;
}

bool ProcessHandle::WaitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (Poll()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (!PumpDiagnostics(kReapInterval)) {
            // stderr is closed, so PumpDiagnostics returned without waiting.
            std::this_thread::sleep_for(kReapInterval);
        }
    }
    return true;
}

void ProcessHandle::Terminate(std::chrono::milliseconds grace) {
    if (state_ == ProcessState::Running) {
        // EOF on stdin is the polite request to exit.
        CloseStdin();
        if (!WaitForExit(grace)) {
            LogDebug("supervisor", "pid " + std::to_string(pid_) +
                                       " ignored stdin EOF, sending SIGTERM");
            ::kill(pid_, SIGTERM);
            if (!WaitForExit(grace)) {
                LogWarn("supervisor", "pid " + std::to_string(pid_) +
                                          " ignored SIGTERM, sending SIGKILL");
                ::kill(pid_, SIGKILL);
                int status = 0;
                pid_t r;
                while ((r = waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {
                }
                if (r == pid_) {
                    exit_status_ = DecodeWaitStatus(status);
                }
                state_ = ProcessState::Exited;
            }
        }
    }
    CloseAll();
}

// ---------------------------------------------------------------------------
// stdin
// ---------------------------------------------------------------------------
Result<void, std::string> ProcessHandle::WriteAll(std::string_view data) {
    if (state_ != ProcessState::Running || stdin_fd_ < 0) {
        return Result<void, std::string>::Err("server process is not running");
    }
    ScopedSigpipeBlock sigpipe_block;
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(stdin_fd_, data.data() + written,
                                  data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                sigpipe_block.NoteBrokenPipe();
            }
            return Result<void, std::string>::Err(
                ErrnoText("write to server stdin"));
        }
        written += static_cast<std::size_t>(n);
    }
    return Result<void, std::string>::Ok();
}

// ---------------------------------------------------------------------------
// stdout
// ---------------------------------------------------------------------------
LineRead ProcessHandle::ReadLine(std::chrono::milliseconds timeout,
                                 const CancellationToken* cancel) {
    using Clock = std::chrono::steady_clock;
    const bool bounded = timeout.count() > 0;
    const auto deadline = Clock::now() + timeout;

    while (true) {
        const auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos) {
            LineRead read{ReadStatus::Line, stdout_buffer_.substr(0, newline), {}};
            stdout_buffer_.erase(0, newline + 1);
            return read;
        }
        if (stdout_fd_ < 0) {
            if (!stdout_buffer_.empty()) {
                LineRead read{ReadStatus::Line, std::move(stdout_buffer_), {}};
                stdout_buffer_.clear();
                return read;
            }
            return LineRead{ReadStatus::Eof, {}, {}};
        }
        if (cancel != nullptr && cancel->IsCancelled()) {
            return LineRead{ReadStatus::Cancelled, {}, {}};
        }

        auto slice = kPollSlice;
        if (bounded) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now());
            if (remaining.count() <= 0) {
                return LineRead{ReadStatus::Timeout, {}, {}};
            }
            slice = std::min(slice, remaining);
        }

        pollfd fds[2] = {{stdout_fd_, POLLIN, 0}, {stderr_fd_, POLLIN, 0}};
        const int ready = ::poll(fds, 2, static_cast<int>(slice.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return LineRead{ReadStatus::IoError, {}, ErrnoText("poll on server pipes")};
        }
        if (ready == 0) {
            continue;
        }
        if (fds[1].revents != 0) {
            PumpDiagnostics(std::chrono::milliseconds(0));
        }
        if (fds[0].revents != 0) {
            char chunk[kReadChunk];
            const ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
            if (n > 0) {
                stdout_buffer_.append(chunk, static_cast<std::size_t>(n));
            } else if (n == 0) {
                CloseFd(stdout_fd_);
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return LineRead{ReadStatus::IoError, {}, ErrnoText("read from server stdout")};
            }
        }
    }
}

// ---------------------------------------------------------------------------
// stderr
// ---------------------------------------------------------------------------
bool ProcessHandle::PumpDiagnostics(std::chrono::milliseconds wait) {
    if (stderr_fd_ < 0) {
        return false;
    }
    pollfd pfd{stderr_fd_, POLLIN, 0};
    if (::poll(&pfd, 1, static_cast<int>(wait.count())) <= 0) {
        return true;
    }
    char chunk[kReadChunk];
    while (true) {
        const ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            AppendDiagnostics(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        // EOF or a hard error: nothing more will arrive.
        CloseFd(stderr_fd_);
        return false;
    }
}

void ProcessHandle::DrainDiagnostics(std::chrono::milliseconds idle) {
    while (true) {
        const auto before = diagnostics_seen_;
        if (!PumpDiagnostics(idle) || diagnostics_seen_ == before) {
            return;
        }
    }
}

// When the cap dropped older bytes, the text starts with a
// "[... N bytes dropped]" line.
std::string ProcessHandle::TakeDiagnostics() {
    PumpDiagnostics(std::chrono::milliseconds(0));
    std::string out;
    if (diagnostics_dropped_ > 0) {
        out = "[... " + std::to_string(diagnostics_dropped_) + " bytes dropped]\n";
    }
    out += diagnostics_;
    diagnostics_.clear();
    diagnostics_dropped_ = 0;
    return out;
}

void ProcessHandle::AppendDiagnostics(const char* data, std::size_t size) {
    diagnostics_seen_ += size;
    diagnostics_.append(data, size);
    if (diagnostics_.size() > diagnostics_limit_) {
        const auto excess = diagnostics_.size() - diagnostics_limit_;
        diagnostics_.erase(0, excess);
        diagnostics_dropped_ += excess;
    }
}

void ProcessHandle::CloseStdin() {
    CloseFd(stdin_fd_);
}

void ProcessHandle::CloseAll() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

} // namespace mcp_cli
