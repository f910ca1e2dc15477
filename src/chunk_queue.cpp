#include "rangeget/chunk_queue.hpp"

namespace rangeget {

ChunkQueue::ChunkQueue(std::vector<Chunk> chunks)
    : capacity_(chunks.size()), pending_(chunks.begin(), chunks.end()) {}

std::optional<Chunk> ChunkQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    Chunk chunk = pending_.front();
    pending_.pop_front();
    return chunk;
}

std::size_t ChunkQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t dropped = pending_.size();
    pending_.clear();
    return dropped;
}

std::size_t ChunkQueue::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace rangeget
