#include "rangeget/transfer_state.hpp"

#include <utility>

namespace rangeget {

TransferState::TransferState(std::uint64_t total_bytes, Clock::time_point start_time)
    : total_bytes_(total_bytes), start_time_(start_time) {}

void TransferState::addBytes(std::uint64_t bytes) noexcept {
    downloaded_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void TransferState::subtractBytes(std::uint64_t bytes) noexcept {
    downloaded_bytes_.fetch_sub(bytes, std::memory_order_relaxed);
}

std::uint64_t TransferState::downloaded() const noexcept {
    return downloaded_bytes_.load(std::memory_order_relaxed);
}

std::chrono::milliseconds TransferState::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time_);
}

void TransferState::addError(ChunkError error) {
    std::lock_guard<std::mutex> lock(errors_mutex_);
    errors_.push_back(std::move(error));
}

std::vector<ChunkError> TransferState::errors() const {
    std::lock_guard<std::mutex> lock(errors_mutex_);
    return errors_;
}

std::size_t TransferState::errorCount() const {
    std::lock_guard<std::mutex> lock(errors_mutex_);
    return errors_.size();
}

} // namespace rangeget
