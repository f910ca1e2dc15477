#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace rangeget::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

// Routes libcurl's verbose output into the spdlog trace level.
void enableCurlTrace(CURL* handle);

} // namespace rangeget::detail
