#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rangeget {

// Inclusive byte range of the remote resource, planned as one unit of work.
struct Chunk {
    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t size() const { return end - start + 1; }
};

// Partitions [0, total_size) into contiguous chunks of roughly chunk_size
// bytes. The number of chunks never exceeds stream_count * 4; when it
// would, the chunk size grows instead.
[[nodiscard]] std::vector<Chunk> planChunks(std::uint64_t total_size, int stream_count,
                                            std::uint64_t chunk_size);

} // namespace rangeget
