#pragma once

#include <atomic>
#include <memory>

namespace mcp_cli {

// ---------------------------------------------------------------------------
// CancellationToken - copyable flag shared between a waiting call and
// whoever wants to abort it (another thread, a signal handler's watcher).
// Copies observe the same flag.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool IsCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace mcp_cli
