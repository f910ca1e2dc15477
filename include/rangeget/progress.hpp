#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace rangeget {

enum class TransferPhase {
    Probing,
    Planning,
    Transferring,
    Reconciling,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] const char* toString(TransferPhase phase);
[[nodiscard]] bool isTerminal(TransferPhase phase);

struct Progress {
    std::string url;
    std::string filename;
    std::string display_id;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    std::chrono::milliseconds elapsed{0};
    TransferPhase phase{TransferPhase::Probing};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;

    // Average rate since the job started.
    [[nodiscard]] double bytesPerSecond() const;
};

using ProgressObserver = std::function<void(const Progress&)>;

} // namespace rangeget
