#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/detail/http_headers.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace rangeget::detail {

namespace {

int curlDebugCallback(CURL* /* handle */, curl_infotype type, char* data, size_t size, void* /* userptr */) {
    const std::string_view text(data, size);
    switch (type) {
    case CURLINFO_TEXT:
        spdlog::trace("* {}", text);
        break;
    case CURLINFO_HEADER_OUT:
        spdlog::trace("> {}", redactAuthorization(text));
        break;
    case CURLINFO_HEADER_IN:
        spdlog::trace("< {}", text);
        break;
    default:
        break;
    }
    return 0;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

void enableCurlTrace(CURL* handle) {
    if (!spdlog::should_log(spdlog::level::trace)) {
        return;
    }
    curl_easy_setopt(handle, CURLOPT_DEBUGFUNCTION, &curlDebugCallback);
    curl_easy_setopt(handle, CURLOPT_VERBOSE, 1L);
}

} // namespace rangeget::detail
