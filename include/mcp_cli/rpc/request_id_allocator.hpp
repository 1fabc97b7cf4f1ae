#pragma once

#include <cstdint>

namespace mcp_cli {

using RequestId = std::int64_t;

// ---------------------------------------------------------------------------
// RequestIdAllocator - 1, 2, 3, ... for the lifetime of one exchange.
// Never reset by process restarts. Not thread-safe; RequestExchange holds
// its call mutex while allocating.
// ---------------------------------------------------------------------------
class RequestIdAllocator {
public:
    [[nodiscard]] RequestId Next() noexcept { return ++last_; }

    // Most recently issued id, 0 before the first Next().
    [[nodiscard]] RequestId Last() const noexcept { return last_; }

private:
    RequestId last_ = 0;
};

} // namespace mcp_cli
