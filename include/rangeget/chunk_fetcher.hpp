#pragma once

#include "cancellation.hpp"
#include "chunk.hpp"
#include "http_transport.hpp"
#include "output_file.hpp"
#include "transfer_job.hpp"
#include "transfer_state.hpp"

#include <cstdint>
#include <string>

namespace rangeget {

enum class ChunkStatus {
    Completed,
    Failed,
    Cancelled,
};

struct ChunkOutcome {
    ChunkStatus status{ChunkStatus::Failed};
    int attempts{0};
    std::string error;
};

// Downloads single chunks into their offsets of the output file, retrying
// each chunk from its start with exponential backoff.
class ChunkFetcher {
public:
    ChunkFetcher(HttpTransport& transport, const TransferJob& job, OutputFile& file,
                 TransferState& state, const CancellationToken& cancel);

    [[nodiscard]] ChunkOutcome fetch(const Chunk& chunk);

private:
    struct AttemptResult {
        bool ok{false};
        bool cancelled{false};
        bool retryable{true};
        std::uint64_t written{0};
        std::string error;
    };

    AttemptResult fetchOnce(const Chunk& chunk);

    HttpTransport& transport_;
    const TransferJob& job_;
    OutputFile& file_;
    TransferState& state_;
    const CancellationToken& cancel_;
};

} // namespace rangeget
