#include "rangeget/progress_aggregator.hpp"

#include <utility>

namespace rangeget {

ProgressAggregator::ProgressAggregator(Progress initial, ProgressObserver observer,
                                       std::chrono::milliseconds interval)
    : observer_(std::move(observer)),
      interval_(interval),
      snapshot_(std::move(initial)),
      start_time_(std::chrono::steady_clock::now()) {}

ProgressAggregator::~ProgressAggregator() { stopSampling(); }

void ProgressAggregator::update(std::uint64_t downloaded, std::uint64_t total) {
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_.downloaded_bytes = downloaded;
        snapshot_.total_bytes = total;
        snapshot_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
    }
    publish();
}

void ProgressAggregator::setPhase(TransferPhase phase) {
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_.phase = phase;
        snapshot_.is_running = !isTerminal(phase);
        snapshot_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
    }
    publish();
}

void ProgressAggregator::setError(std::string message) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_.has_error = true;
    if (snapshot_.error_message.empty()) {
        snapshot_.error_message = std::move(message);
    }
}

void ProgressAggregator::startSampling(const TransferState& state) {
    stopSampling();

    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        start_time_ = state.startTime();
    }
    {
        std::lock_guard<std::mutex> lock(sampling_mutex_);
        stop_requested_ = false;
    }
    sampler_ = std::thread([this, &state]() { samplingLoop(&state); });
}

void ProgressAggregator::stopSampling() {
    {
        std::lock_guard<std::mutex> lock(sampling_mutex_);
        stop_requested_ = true;
    }
    sampling_cv_.notify_all();
    if (sampler_.joinable()) {
        sampler_.join();
    }
}

Progress ProgressAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

void ProgressAggregator::samplingLoop(const TransferState* state) {
    std::unique_lock<std::mutex> lock(sampling_mutex_);
    while (!sampling_cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
        lock.unlock();
        update(state->downloaded(), state->total());
        lock.lock();
    }
}

void ProgressAggregator::publish() {
    if (!observer_) {
        return;
    }
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    const Progress current = snapshot();
    observer_(current);
}

} // namespace rangeget
