#include "rangeget/chunk.hpp"

#include <catch2/catch.hpp>

#include <cstdint>

using rangeget::Chunk;
using rangeget::planChunks;

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

void requirePartition(const std::vector<Chunk>& chunks, std::uint64_t total_size) {
    REQUIRE_FALSE(chunks.empty());
    REQUIRE(chunks.front().start == 0);
    REQUIRE(chunks.back().end == total_size - 1);

    std::uint64_t covered = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].index == i);
        REQUIRE(chunks[i].start <= chunks[i].end);
        if (i > 0) {
            REQUIRE(chunks[i - 1].end + 1 == chunks[i].start);
        }
        covered += chunks[i].size();
    }
    REQUIRE(covered == total_size);
}

} // namespace

TEST_CASE("Small resources are planned as a single chunk", "[planner]") {
    const auto chunk_size = 16 * MiB;

    for (std::uint64_t total : {std::uint64_t{1}, std::uint64_t{4096}, 16 * MiB - 1, 16 * MiB}) {
        const auto chunks = planChunks(total, 8, chunk_size);
        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].index == 0);
        CHECK(chunks[0].start == 0);
        CHECK(chunks[0].end == total - 1);
    }
}

TEST_CASE("100 MiB with 16 MiB chunks and 8 streams yields 7 chunks", "[planner]") {
    const auto chunks = planChunks(100 * MiB, 8, 16 * MiB);

    REQUIRE(chunks.size() == 7);
    for (std::size_t i = 0; i < 6; ++i) {
        CHECK(chunks[i].size() == 16 * MiB);
    }
    CHECK(chunks[6].size() == 4 * MiB);
    requirePartition(chunks, 100 * MiB);
}

TEST_CASE("Chunk count is capped at four per stream", "[planner]") {
    SECTION("chunk size grows to fit the cap") {
        const auto chunks = planChunks(1024 * MiB, 2, MiB);
        REQUIRE(chunks.size() == 8);
        CHECK(chunks[0].size() == 128 * MiB);
        requirePartition(chunks, 1024 * MiB);
    }

    SECTION("uneven sizes still stay under the cap") {
        const auto chunks = planChunks(10, 1, 1);
        REQUIRE(chunks.size() == 4);
        CHECK(chunks[0].size() == 3);
        CHECK(chunks[3].size() == 1);
        requirePartition(chunks, 10);
    }

    SECTION("a non-positive stream count counts as one stream") {
        const auto chunks = planChunks(100, 0, 1);
        CHECK(chunks.size() <= 4);
        requirePartition(chunks, 100);
    }
}

TEST_CASE("Plans partition the resource for many shapes", "[planner]") {
    const std::uint64_t sizes[] = {2, 3, 17, 999, 4096, 65537, 10 * MiB + 3, 100 * MiB, 3 * 1024 * MiB + 11};
    const int streams[] = {1, 3, 8, 16};
    const std::uint64_t chunk_sizes[] = {1, 7, 4096, MiB, 16 * MiB};

    for (const auto total : sizes) {
        for (const auto stream_count : streams) {
            for (const auto chunk_size : chunk_sizes) {
                const auto chunks = planChunks(total, stream_count, chunk_size);
                INFO("total=" << total << " streams=" << stream_count << " chunk=" << chunk_size);
                requirePartition(chunks, total);
                CHECK(chunks.size() <= static_cast<std::size_t>(stream_count) * 4);
            }
        }
    }
}

TEST_CASE("An empty resource has no chunks", "[planner]") {
    CHECK(planChunks(0, 8, 16 * MiB).empty());
}

TEST_CASE("A zero chunk size is treated as one byte", "[planner]") {
    const auto chunks = planChunks(5, 8, 0);
    REQUIRE(chunks.size() == 5);
    requirePartition(chunks, 5);
}
