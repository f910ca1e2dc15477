#include "rangeget/range_downloader.hpp"

#include "rangeget/cancellation.hpp"
#include "rangeget/chunk.hpp"
#include "rangeget/chunk_fetcher.hpp"
#include "rangeget/chunk_queue.hpp"
#include "rangeget/config.hpp"
#include "rangeget/curl_transport.hpp"
#include "rangeget/output_file.hpp"
#include "rangeget/progress_aggregator.hpp"
#include "rangeget/transfer_state.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

class RangeDownloader::Impl {
public:
    Impl(TransferJob job, HttpTransportPtr transport, ProgressObserver observer)
        : job_(std::move(job)),
          transport_(std::move(transport)),
          progress_(initialProgress(job_), std::move(observer), job_.options.progress_interval) {
        job_.options.stream_count = std::clamp(job_.options.stream_count, 1, kMaxStreams);
    }

    TransferResult run() {
        // The running job owns the progress state, so this refusal leaves it alone.
        if (running_.exchange(true)) {
            return failed("download is already running");
        }

        spdlog::info("Downloading {} -> {}", job_.url, job_.destination);
        TransferResult result = execute();
        progress_.setPhase(phaseFor(result.outcome));
        running_ = false;

        switch (result.outcome) {
        case TransferOutcome::Completed:
            spdlog::info("Finished {} ({} bytes)", job_.destination, result.bytes_transferred);
            break;
        case TransferOutcome::Cancelled:
            spdlog::warn("Download of {} cancelled", job_.destination);
            break;
        case TransferOutcome::Failed:
            spdlog::error("Download of {} failed: {}", job_.destination, result.message);
            break;
        }
        return result;
    }

    void cancel() { cancel_.cancel(); }

    [[nodiscard]] Progress getProgress() const { return progress_.snapshot(); }

    [[nodiscard]] bool isRunning() const { return running_; }

    [[nodiscard]] bool hasError() const { return progress_.snapshot().has_error; }

private:
    struct ProbeOutcome {
        std::uint64_t total_size{0};
        bool supports_range{false};
    };

    static Progress initialProgress(const TransferJob& job) {
        Progress progress;
        progress.url = job.url;
        progress.filename = job.destination;
        progress.display_id = job.display_id;
        progress.total_bytes = job.known_size;
        progress.phase = TransferPhase::Probing;
        return progress;
    }

    static TransferPhase phaseFor(TransferOutcome outcome) {
        switch (outcome) {
        case TransferOutcome::Completed:
            return TransferPhase::Completed;
        case TransferOutcome::Cancelled:
            return TransferPhase::Cancelled;
        case TransferOutcome::Failed:
            break;
        }
        return TransferPhase::Failed;
    }

    TransferResult execute() {
        progress_.setPhase(TransferPhase::Probing);
        if (cancel_.isCancelled()) {
            return cancelled(0);
        }

        TransferResult failure;
        const auto probe = probeResource(failure);
        if (!probe) {
            return failure;
        }

        if (!probe->supports_range) {
            spdlog::debug("Server does not accept byte ranges, using a single stream");
            return singleStreamDownload(probe->total_size);
        }

        return multiStreamDownload(probe->total_size);
    }

    std::optional<ProbeOutcome> probeResource(TransferResult& failure) {
        const ProbeResult probe = transport_->probe(job_.url, job_.auth_header, cancel_);
        if (cancel_.isCancelled()) {
            failure = cancelled(0);
            return std::nullopt;
        }
        if (!probe.ok) {
            // Some servers refuse HEAD but serve GET. With the size already
            // known, a refused probe only costs the range support.
            if (job_.known_size > 0 && probe.status_code >= 400) {
                spdlog::warn("Probe of {} answered {}, downloading {} bytes with a single stream", job_.url,
                             probe.status_code, job_.known_size);
                progress_.update(0, job_.known_size);
                return ProbeOutcome{job_.known_size, false};
            }
            failure = fail(probe.error.empty() ? "probe request failed" : probe.error);
            return std::nullopt;
        }

        ProbeOutcome outcome;
        outcome.supports_range = probe.accepts_ranges;
        outcome.total_size = probe.content_length.value_or(job_.known_size);
        if (outcome.total_size == 0) {
            failure = fail("server did not return Content-Length");
            return std::nullopt;
        }

        spdlog::info("Remote size {} bytes, byte ranges {}", outcome.total_size,
                     outcome.supports_range ? "supported" : "not supported");
        progress_.update(0, outcome.total_size);
        return outcome;
    }

    TransferResult multiStreamDownload(std::uint64_t total_size) {
        progress_.setPhase(TransferPhase::Planning);
        const auto chunks = planChunks(total_size, job_.options.stream_count, job_.options.chunk_size);
        spdlog::info("Planned {} chunks for {} streams", chunks.size(), job_.options.stream_count);

        std::unique_ptr<OutputFile> file;
        try {
            file = std::make_unique<OutputFile>(job_.destination);
        } catch (const std::exception& ex) {
            return fail(ex.what());
        }

        if (const auto ec = file->preallocate(total_size)) {
            spdlog::warn("Cannot preallocate {} to {} bytes: {}", job_.destination, total_size, ec.message());
        }

        TransferState state(total_size);
        ChunkQueue queue(chunks);
        ChunkFetcher fetcher(*transport_, job_, *file, state, cancel_);

        progress_.setPhase(TransferPhase::Transferring);
        progress_.startSampling(state);

        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(job_.options.stream_count));
        for (int i = 0; i < job_.options.stream_count; ++i) {
            workers.emplace_back([this, &queue, &fetcher, &state]() { workerLoop(queue, fetcher, state); });
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();

        progress_.stopSampling();
        progress_.setPhase(TransferPhase::Reconciling);
        progress_.update(state.downloaded(), total_size);

        const auto close_error = file->close();

        if (cancel_.isCancelled()) {
            return cancelled(state.downloaded());
        }

        const auto errors = state.errors();
        if (!errors.empty()) {
            TransferResult result = fail(fmt::format("download failed with {} errors: {}", errors.size(),
                                                     errors.front().message));
            result.failed_chunks = errors.size();
            result.bytes_transferred = state.downloaded();
            return result;
        }

        if (close_error) {
            return fail(fmt::format("Cannot finish writing {}: {}", job_.destination, close_error.message()));
        }

        TransferResult result;
        result.outcome = TransferOutcome::Completed;
        result.bytes_transferred = state.downloaded();
        return result;
    }

    void workerLoop(ChunkQueue& queue, ChunkFetcher& fetcher, TransferState& state) {
        while (!cancel_.isCancelled()) {
            const auto chunk = queue.pop();
            if (!chunk) {
                return;
            }
            if (cancel_.isCancelled()) {
                break;
            }

            spdlog::debug("Chunk {} [{}-{}] started", chunk->index, chunk->start, chunk->end);
            const ChunkOutcome outcome = fetcher.fetch(*chunk);
            switch (outcome.status) {
            case ChunkStatus::Completed:
                spdlog::debug("Chunk {} done after {} attempt(s)", chunk->index, outcome.attempts);
                break;
            case ChunkStatus::Failed:
                spdlog::error("{}", outcome.error);
                progress_.setError(outcome.error);
                state.addError({chunk->index, outcome.error});
                break;
            case ChunkStatus::Cancelled:
                break;
            }
        }

        const std::size_t dropped = queue.drain();
        if (dropped > 0) {
            spdlog::debug("Dropped {} pending chunks after cancellation", dropped);
        }
    }

    TransferResult singleStreamDownload(std::uint64_t total_size) {
        std::unique_ptr<OutputFile> file;
        try {
            file = std::make_unique<OutputFile>(job_.destination);
        } catch (const std::exception& ex) {
            return fail(ex.what());
        }

        TransferState state(total_size);
        std::string write_error;
        const BodySink sink = [&](const char* data, std::size_t size) {
            if (const auto ec = file->append(data, size)) {
                write_error = fmt::format("write failed: {}", ec.message());
                return false;
            }
            state.addBytes(size);
            return true;
        };

        progress_.setPhase(TransferPhase::Transferring);
        progress_.startSampling(state);

        const FetchRequest request{job_.url, job_.auth_header, std::nullopt};
        const FetchResult fetched = transport_->fetch(request, sink, cancel_);

        progress_.stopSampling();
        progress_.setPhase(TransferPhase::Reconciling);
        progress_.update(state.downloaded(), total_size);

        const auto close_error = file->close();

        TransferResult result;
        result.used_fallback = true;
        result.bytes_transferred = state.downloaded();

        if (fetched.cancelled || cancel_.isCancelled()) {
            result.outcome = TransferOutcome::Cancelled;
            result.message = "download cancelled";
            return result;
        }

        std::string error;
        if (!write_error.empty()) {
            error = write_error;
        } else if (!fetched.ok) {
            error = fetched.error;
        } else if (close_error) {
            error = fmt::format("Cannot finish writing {}: {}", job_.destination, close_error.message());
        } else if (total_size > 0 && state.downloaded() != total_size) {
            error = fmt::format("incomplete download: got {} bytes, expected {}", state.downloaded(), total_size);
        }

        if (!error.empty()) {
            result.outcome = TransferOutcome::Failed;
            result.message = fmt::format("single-stream download failed: {}", error);
            progress_.setError(result.message);
            return result;
        }

        result.outcome = TransferOutcome::Completed;
        return result;
    }

    TransferResult fail(std::string message) {
        progress_.setError(message);
        return failed(std::move(message));
    }

    static TransferResult failed(std::string message) {
        TransferResult result;
        result.outcome = TransferOutcome::Failed;
        result.message = std::move(message);
        return result;
    }

    static TransferResult cancelled(std::uint64_t bytes) {
        TransferResult result;
        result.outcome = TransferOutcome::Cancelled;
        result.message = "download cancelled";
        result.bytes_transferred = bytes;
        return result;
    }

    TransferJob job_;
    HttpTransportPtr transport_;
    CancellationToken cancel_;
    ProgressAggregator progress_;
    std::atomic<bool> running_{false};
};

RangeDownloader::RangeDownloader(TransferJob job, ProgressObserver observer)
    : RangeDownloader(job, std::make_shared<CurlTransport>(job.options), std::move(observer)) {}

RangeDownloader::RangeDownloader(TransferJob job, HttpTransportPtr transport, ProgressObserver observer)
    : impl_(std::make_unique<Impl>(std::move(job), std::move(transport), std::move(observer))) {}

RangeDownloader::~RangeDownloader() = default;

TransferResult RangeDownloader::run() { return impl_->run(); }

void RangeDownloader::cancel() { impl_->cancel(); }

Progress RangeDownloader::getProgress() const { return impl_->getProgress(); }

bool RangeDownloader::isRunning() const { return impl_->isRunning(); }

bool RangeDownloader::hasError() const { return impl_->hasError(); }

} // namespace rangeget
