#include "rangeget/chunk.hpp"

#include <algorithm>

namespace rangeget {

std::vector<Chunk> planChunks(std::uint64_t total_size, int stream_count, std::uint64_t chunk_size) {
    std::vector<Chunk> chunks;
    if (total_size == 0) {
        return chunks;
    }

    chunk_size = std::max<std::uint64_t>(1, chunk_size);
    if (total_size <= chunk_size) {
        chunks.push_back({0, 0, total_size - 1});
        return chunks;
    }

    std::uint64_t chunk_count = (total_size + chunk_size - 1) / chunk_size;

    // Keep the queue a few chunks deep per stream, no deeper.
    const std::uint64_t max_chunks = static_cast<std::uint64_t>(std::max(1, stream_count)) * 4;
    if (chunk_count > max_chunks) {
        chunk_size = (total_size + max_chunks - 1) / max_chunks;
        chunk_count = (total_size + chunk_size - 1) / chunk_size;
    }

    chunks.reserve(static_cast<std::size_t>(chunk_count));
    std::uint64_t start = 0;
    while (start < total_size) {
        const std::uint64_t end = std::min(start + chunk_size - 1, total_size - 1);
        chunks.push_back({chunks.size(), start, end});
        start = end + 1;
    }

    return chunks;
}

} // namespace rangeget
