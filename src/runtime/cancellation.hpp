#pragma once
#include <atomic>

namespace mcpguard::runtime {

// Cooperative cancellation flag with an eventfd that becomes readable on
// cancel(), so poll() loops wake immediately
class CancellationToken {
public:
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Returns false if already cancelled
    bool cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // -1 if eventfd creation failed; callers then rely on polling timeouts
    int wait_fd() const { return event_fd_; }

private:
    std::atomic<bool> cancelled_{false};
    int event_fd_ = -1;
};

} // namespace mcpguard::runtime
