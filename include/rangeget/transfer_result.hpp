#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace rangeget {

enum class TransferOutcome {
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] const char* toString(TransferOutcome outcome);

struct TransferResult {
    TransferOutcome outcome{TransferOutcome::Failed};
    std::string message;
    std::size_t failed_chunks{0};
    std::uint64_t bytes_transferred{0};
    bool used_fallback{false};

    [[nodiscard]] bool ok() const { return outcome == TransferOutcome::Completed; }
};

} // namespace rangeget
