#include "rangeget/chunk_fetcher.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

ChunkFetcher::ChunkFetcher(HttpTransport& transport, const TransferJob& job, OutputFile& file,
                           TransferState& state, const CancellationToken& cancel)
    : transport_(transport), job_(job), file_(file), state_(state), cancel_(cancel) {}

ChunkOutcome ChunkFetcher::fetch(const Chunk& chunk) {
    const RetryPolicy& policy = job_.options.retry;
    const int max_attempts = std::max(1, policy.max_attempts);

    ChunkOutcome outcome;
    std::uint64_t previous_attempt_bytes = 0;
    std::string last_error;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            // The whole chunk is fetched again, so its earlier credit goes.
            if (previous_attempt_bytes > 0) {
                state_.subtractBytes(previous_attempt_bytes);
                previous_attempt_bytes = 0;
            }

            const auto delay = policy.delayBefore(attempt);
            spdlog::warn("Chunk {} attempt {}/{} failed: {}; retrying in {} ms", chunk.index,
                         attempt - 1, max_attempts, last_error, delay.count());
            if (cancel_.waitFor(delay)) {
                outcome.status = ChunkStatus::Cancelled;
                outcome.error = "cancelled";
                return outcome;
            }
        }

        outcome.attempts = attempt;
        const AttemptResult result = fetchOnce(chunk);
        if (result.ok) {
            outcome.status = ChunkStatus::Completed;
            return outcome;
        }

        if (result.cancelled || cancel_.isCancelled()) {
            outcome.status = ChunkStatus::Cancelled;
            outcome.error = "cancelled";
            return outcome;
        }

        last_error = result.error;
        previous_attempt_bytes = result.written;
        if (!result.retryable) {
            outcome.status = ChunkStatus::Failed;
            outcome.error = fmt::format("chunk {} failed: {}", chunk.index, last_error);
            return outcome;
        }
    }

    outcome.status = ChunkStatus::Failed;
    outcome.error = fmt::format("chunk {} failed: retries exhausted after {} attempts: {}",
                                chunk.index, max_attempts, last_error);
    return outcome;
}

ChunkFetcher::AttemptResult ChunkFetcher::fetchOnce(const Chunk& chunk) {
    AttemptResult result;

    const std::uint64_t expected = chunk.size();
    std::uint64_t offset = chunk.start;
    std::string write_error;

    const BodySink sink = [&](const char* data, std::size_t size) {
        if (result.written + size > expected) {
            write_error = fmt::format("server sent more than the requested {} bytes", expected);
            return false;
        }
        if (const auto ec = file_.writeAt(data, size, offset)) {
            write_error = fmt::format("write failed: {}", ec.message());
            return false;
        }
        offset += size;
        result.written += size;
        state_.addBytes(size);
        return true;
    };

    FetchRequest request{job_.url, job_.auth_header, ByteRange{chunk.start, chunk.end}};
    const FetchResult fetched = transport_.fetch(request, sink, cancel_);

    if (fetched.cancelled || cancel_.isCancelled()) {
        result.cancelled = true;
        result.error = "cancelled";
        return result;
    }
    if (!write_error.empty()) {
        result.error = write_error;
        return result;
    }
    if (!fetched.ok) {
        result.error = fetched.error;
        result.retryable = fetched.retryable;
        return result;
    }
    if (result.written < expected) {
        result.error = fmt::format("incomplete chunk: got {} bytes, expected {}", result.written, expected);
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace rangeget
