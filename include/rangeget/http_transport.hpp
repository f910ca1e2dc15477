#pragma once

#include "cancellation.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rangeget {

struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0}; // inclusive
};

struct ProbeResult {
    bool ok{false};
    long status_code{0};
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string error;
};

struct FetchRequest {
    std::string url;
    std::string auth_header;
    // Unset means the whole resource.
    std::optional<ByteRange> range;
};

struct FetchResult {
    bool ok{false};
    bool cancelled{false};
    long status_code{0};
    std::string error;
    // False when repeating the same request cannot succeed.
    bool retryable{true};
};

// Receives the response body buffer by buffer. Returning false aborts the
// transfer.
using BodySink = std::function<bool(const char* data, std::size_t size)>;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Metadata-only request: status, size and range support.
    [[nodiscard]] virtual ProbeResult probe(const std::string& url, const std::string& auth_header,
                                            const CancellationToken& cancel) = 0;

    // GET with an optional byte range. Ranged requests accept 206, and 200
    // only when the range starts at 0; whole-resource requests accept 200
    // only. The body of any other status is never handed to the sink. A 200
    // to a range starting past 0 is reported as not retryable.
    [[nodiscard]] virtual FetchResult fetch(const FetchRequest& request, const BodySink& sink,
                                            const CancellationToken& cancel) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace rangeget
