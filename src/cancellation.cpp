#include "rangeget/cancellation.hpp"

namespace rangeget {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(std::memory_order_acquire); });
}

} // namespace rangeget
