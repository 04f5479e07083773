#include "runtime/cancellation.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sys/eventfd.h>
#include <unistd.h>

namespace mcpguard::runtime {

CancellationToken::CancellationToken() {
    event_fd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (event_fd_ < 0) {
        spdlog::warn("eventfd failed: {}; cancellation falls back to polling", strerror(errno));
    }
}

CancellationToken::~CancellationToken() {
    if (event_fd_ >= 0) {
        close(event_fd_);
    }
}

bool CancellationToken::cancel() {
    bool expected = false;
    if (!cancelled_.compare_exchange_strong(expected, true)) {
        return false;
    }
    if (event_fd_ >= 0) {
        uint64_t one = 1;
        if (write(event_fd_, &one, sizeof(one)) != sizeof(one)) {
            spdlog::debug("eventfd write failed: {}", strerror(errno));
        }
    }
    return true;
}

} // namespace mcpguard::runtime
