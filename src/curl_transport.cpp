#include "rangeget/curl_transport.hpp"

#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/detail/http_headers.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

namespace {

struct ProbeContext {
    std::map<std::string, std::string> headers;
};

struct FetchContext {
    CURL* handle{nullptr};
    const BodySink* sink{nullptr};
    const CancellationToken* cancel{nullptr};
    bool ranged{false};
    std::uint64_t range_start{0};
    bool status_checked{false};
    bool sink_aborted{false};
    std::string status_error;
    bool status_permanent{false};
};

bool isAcceptedStatus(long code, bool ranged) {
    return code == 200 || (ranged && code == 206);
}

// Records why a status is refused. Returns false for accepted statuses.
bool rejectStatus(FetchContext& ctx, long code) {
    if (!isAcceptedStatus(code, ctx.ranged)) {
        ctx.status_error = fmt::format("unexpected status code: {}", code);
        return true;
    }
    // A 200 carries the resource from offset 0, whatever range was asked for.
    if (ctx.ranged && code == 200 && ctx.range_start != 0) {
        ctx.status_error = fmt::format("server ignored the range request starting at {} (status 200)",
                                       ctx.range_start);
        ctx.status_permanent = true;
        return true;
    }
    return false;
}

size_t probeHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ProbeContext*>(userdata);
    const size_t total = size * nitems;
    const std::string_view line(buffer, total);

    // Each response of a redirect chain starts with a status line; only the
    // headers of the final response count.
    if (detail::isStatusLine(line)) {
        ctx->headers.clear();
    } else if (auto header = detail::parseHeaderLine(line)) {
        ctx->headers[header->first] = std::move(header->second);
    }
    return total;
}

size_t fetchWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    const size_t total = size * nmemb;

    if (ctx->cancel->isCancelled()) {
        return 0;
    }

    if (!ctx->status_checked) {
        long code = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &code);
        ctx->status_checked = true;
        if (rejectStatus(*ctx, code)) {
            return 0;
        }
    }

    if (total == 0) {
        return 0;
    }

    if (!(*ctx->sink)(ptr, total)) {
        ctx->sink_aborted = true;
        return 0;
    }
    return total;
}

int cancelProgressCallback(void* clientp, curl_off_t /* dltotal */, curl_off_t /* dlnow */,
                           curl_off_t /* ultotal */, curl_off_t /* ulnow */) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return cancel->isCancelled() ? 1 : 0;
}

detail::CurlHeaderList buildHeaders(const std::string& auth_header) {
    detail::CurlHeaderList headers{nullptr, &curl_slist_free_all};
    if (!auth_header.empty()) {
        const std::string line = "Authorization: " + auth_header;
        headers.reset(curl_slist_append(nullptr, line.c_str()));
    }
    return headers;
}

} // namespace

CurlTransport::CurlTransport(Settings settings) : settings_(std::move(settings)) {
    detail::ensureCurlInitialized();
}

CurlTransport::CurlTransport(const TransferOptions& options)
    : CurlTransport(Settings{options.user_agent, options.buffer_size, options.connect_timeout_seconds,
                             options.stall_timeout_seconds}) {}

ProbeResult CurlTransport::probe(const std::string& url, const std::string& auth_header,
                                 const CancellationToken& cancel) {
    ProbeResult result;

    auto curl = detail::makeCurlHandle();
    if (!curl) {
        result.error = "Failed to allocate curl handle";
        return result;
    }

    ProbeContext ctx;
    const auto headers = buildHeaders(auth_header);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, settings_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, settings_.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, settings_.stall_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &probeHeaderCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &cancelProgressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &cancel);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    detail::enableCurlTrace(curl.get());

    const CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status_code);
    if (res != CURLE_OK) {
        result.error = fmt::format("HEAD request failed: {}", curl_easy_strerror(res));
        if (result.status_code >= 400) {
            result.error += fmt::format(" (status {})", result.status_code);
        }
        return result;
    }

    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length > 0) {
        result.content_length = static_cast<std::uint64_t>(length);
    }

    const auto it = ctx.headers.find("accept-ranges");
    result.accepts_ranges = it != ctx.headers.end() && detail::acceptsByteRanges(it->second);
    result.ok = true;

    spdlog::debug("Probe {}: status={} length={} accept-ranges={}", url, result.status_code,
                  length, it != ctx.headers.end() ? it->second : std::string{"(none)"});
    return result;
}

FetchResult CurlTransport::fetch(const FetchRequest& request, const BodySink& sink,
                                 const CancellationToken& cancel) {
    FetchResult result;

    auto curl = detail::makeCurlHandle();
    if (!curl) {
        result.error = "Failed to allocate curl handle";
        return result;
    }

    FetchContext ctx;
    ctx.handle = curl.get();
    ctx.sink = &sink;
    ctx.cancel = &cancel;
    ctx.ranged = request.range.has_value();
    ctx.range_start = request.range ? request.range->start : 0;

    const auto headers = buildHeaders(request.auth_header);
    std::string range;
    if (request.range) {
        range = detail::formatRange(request.range->start, request.range->end);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, settings_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, settings_.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, settings_.stall_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(settings_.buffer_size));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &fetchWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &cancelProgressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &cancel);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    detail::enableCurlTrace(curl.get());

    const CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status_code);

    if (cancel.isCancelled()) {
        result.cancelled = true;
        result.error = "cancelled";
        return result;
    }
    if (!ctx.status_error.empty()) {
        result.error = ctx.status_error;
        result.retryable = !ctx.status_permanent;
        return result;
    }
    if (ctx.sink_aborted) {
        result.error = "transfer aborted by receiver";
        return result;
    }
    if (res != CURLE_OK) {
        result.error = fmt::format("curl error: {}", curl_easy_strerror(res));
        if (result.status_code >= 400) {
            result.error += fmt::format(" (status {})", result.status_code);
        }
        return result;
    }
    // An empty body never reaches the write callback.
    if (!ctx.status_checked && rejectStatus(ctx, result.status_code)) {
        result.error = ctx.status_error;
        result.retryable = !ctx.status_permanent;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace rangeget
