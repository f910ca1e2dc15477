#pragma once

#include "chunk.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace rangeget {

// Work queue filled once with the whole plan and closed. Workers pop until
// it is empty; nothing is ever pushed afterwards.
class ChunkQueue {
public:
    explicit ChunkQueue(std::vector<Chunk> chunks);

    [[nodiscard]] std::optional<Chunk> pop();
    // Drops every chunk not yet dispatched and returns how many were dropped.
    std::size_t drain();

    [[nodiscard]] std::size_t remaining() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Chunk> pending_;
};

} // namespace rangeget
