#pragma once

#include "http_transport.hpp"
#include "transfer_job.hpp"

#include <cstddef>
#include <string>

namespace rangeget {

class CurlTransport final : public HttpTransport {
public:
    struct Settings {
        std::string user_agent;
        std::size_t buffer_size{128 * 1024};
        long connect_timeout_seconds{30};
        long stall_timeout_seconds{60};
    };

    explicit CurlTransport(Settings settings);
    explicit CurlTransport(const TransferOptions& options);

    [[nodiscard]] ProbeResult probe(const std::string& url, const std::string& auth_header,
                                    const CancellationToken& cancel) override;
    [[nodiscard]] FetchResult fetch(const FetchRequest& request, const BodySink& sink,
                                    const CancellationToken& cancel) override;

private:
    Settings settings_;
};

} // namespace rangeget
