#pragma once

#include "transfer_job.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rangeget {

inline constexpr int kMaxStreams = 64;
inline constexpr std::size_t kMinBufferSize = 1024;
inline constexpr std::size_t kMaxBufferSize = 512 * 1024;

// Parses "1048576", "512K", "16M", "1G" (binary multiples). Throws
// std::invalid_argument on malformed input.
[[nodiscard]] std::uint64_t parseByteSize(const std::string& text);

// Applies RANGEGET_STREAMS, RANGEGET_CHUNK_SIZE and RANGEGET_BUFFER_SIZE
// when they are set.
void applyEnvironment(TransferOptions& options);

// Throws std::invalid_argument describing the first offending field.
void validateOptions(const TransferOptions& options);

} // namespace rangeget
