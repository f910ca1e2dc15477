#pragma once

#include "retry_policy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rangeget {

struct TransferOptions {
    int stream_count{8};
    std::uint64_t chunk_size{16ULL * 1024 * 1024};
    std::size_t buffer_size{128 * 1024};
    RetryPolicy retry{};
    long connect_timeout_seconds{30};
    // Abort a request that stays below 1 byte/s for this long.
    long stall_timeout_seconds{60};
    std::chrono::milliseconds progress_interval{50};
    std::string user_agent{"rangeget/0.1"};
};

struct TransferJob {
    std::string url;
    // Full value of the Authorization header, e.g. "Bearer ...". Empty means none.
    std::string auth_header;
    std::string destination;
    // Shown by the progress display only.
    std::string display_id;
    // Size obtained by the caller beforehand (e.g. from a remote stat). Used
    // when the server does not report Content-Length. Zero means unknown.
    std::uint64_t known_size{0};
    TransferOptions options{};
};

} // namespace rangeget
