#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace rangeget {

struct ChunkError {
    std::size_t chunk_index{0};
    std::string message;
};

// Progress and error record shared by the coordinator and every fetch worker.
class TransferState {
public:
    using Clock = std::chrono::steady_clock;

    explicit TransferState(std::uint64_t total_bytes, Clock::time_point start_time = Clock::now());

    TransferState(const TransferState&) = delete;
    TransferState& operator=(const TransferState&) = delete;

    void addBytes(std::uint64_t bytes) noexcept;
    // Withdraws the credit of a failed attempt before its chunk is retried.
    void subtractBytes(std::uint64_t bytes) noexcept;

    [[nodiscard]] std::uint64_t downloaded() const noexcept;
    [[nodiscard]] std::uint64_t total() const noexcept { return total_bytes_; }
    [[nodiscard]] Clock::time_point startTime() const noexcept { return start_time_; }
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

    void addError(ChunkError error);
    [[nodiscard]] std::vector<ChunkError> errors() const;
    [[nodiscard]] std::size_t errorCount() const;

private:
    std::atomic<std::uint64_t> downloaded_bytes_{0};
    const std::uint64_t total_bytes_;
    const Clock::time_point start_time_;

    mutable std::mutex errors_mutex_;
    std::vector<ChunkError> errors_;
};

} // namespace rangeget
