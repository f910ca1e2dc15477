#include "rangeget/config.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace rangeget {

namespace {

const char* environmentValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

std::uint64_t parseByteSize(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        throw std::invalid_argument(fmt::format("Invalid size: '{}'", text));
    }

    std::size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("Invalid size: '{}'", text));
    }

    std::uint64_t multiplier = 1;
    const std::string suffix = text.substr(consumed);
    if (suffix.empty() || suffix == "B" || suffix == "b") {
        multiplier = 1;
    } else if (suffix == "K" || suffix == "k" || suffix == "KiB") {
        multiplier = 1024ULL;
    } else if (suffix == "M" || suffix == "m" || suffix == "MiB") {
        multiplier = 1024ULL * 1024;
    } else if (suffix == "G" || suffix == "g" || suffix == "GiB") {
        multiplier = 1024ULL * 1024 * 1024;
    } else {
        throw std::invalid_argument(fmt::format("Invalid size suffix in '{}'", text));
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw std::invalid_argument(fmt::format("Size out of range: '{}'", text));
    }
    return static_cast<std::uint64_t>(value) * multiplier;
}

void applyEnvironment(TransferOptions& options) {
    if (const char* streams = environmentValue("RANGEGET_STREAMS")) {
        try {
            options.stream_count = std::stoi(streams);
        } catch (const std::exception&) {
            throw std::invalid_argument(fmt::format("Invalid RANGEGET_STREAMS: '{}'", streams));
        }
    }
    if (const char* chunk = environmentValue("RANGEGET_CHUNK_SIZE")) {
        options.chunk_size = parseByteSize(chunk);
    }
    if (const char* buffer = environmentValue("RANGEGET_BUFFER_SIZE")) {
        options.buffer_size = static_cast<std::size_t>(parseByteSize(buffer));
    }
}

void validateOptions(const TransferOptions& options) {
    if (options.stream_count < 1 || options.stream_count > kMaxStreams) {
        throw std::invalid_argument(
            fmt::format("Stream count must be between 1 and {}, got {}", kMaxStreams, options.stream_count));
    }
    if (options.chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be at least 1 byte");
    }
    if (options.buffer_size < kMinBufferSize || options.buffer_size > kMaxBufferSize) {
        throw std::invalid_argument(fmt::format("Buffer size must be between {} and {} bytes, got {}",
                                                kMinBufferSize, kMaxBufferSize, options.buffer_size));
    }
    if (options.retry.max_attempts < 1) {
        throw std::invalid_argument("Retry attempts must be at least 1");
    }
}

} // namespace rangeget
