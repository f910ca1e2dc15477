#pragma once

#include "progress.hpp"
#include "transfer_state.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace rangeget {

// Publishes progress snapshots to an observer. While sampling is active a
// dedicated thread reads the shared byte counter at a fixed interval, so
// fetch workers never talk to the display layer.
class ProgressAggregator {
public:
    ProgressAggregator(Progress initial, ProgressObserver observer,
                       std::chrono::milliseconds interval = std::chrono::milliseconds{50});
    ~ProgressAggregator();

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void update(std::uint64_t downloaded, std::uint64_t total);
    void setPhase(TransferPhase phase);
    void setError(std::string message);

    // The state must outlive the sampling loop, i.e. until stopSampling().
    void startSampling(const TransferState& state);
    void stopSampling();

    [[nodiscard]] Progress snapshot() const;

private:
    void samplingLoop(const TransferState* state);
    void publish();

    ProgressObserver observer_;
    const std::chrono::milliseconds interval_;
    mutable std::mutex snapshot_mutex_;
    Progress snapshot_;
    std::chrono::steady_clock::time_point start_time_;

    // Serialises observer calls between the sampling thread and the owner.
    std::mutex publish_mutex_;

    std::mutex sampling_mutex_;
    std::condition_variable sampling_cv_;
    bool stop_requested_{false};
    std::thread sampler_;
};

} // namespace rangeget
