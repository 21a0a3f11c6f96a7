#pragma once

#include <memory>

#include <curl/curl.h>

namespace dlqueue::detail {

using CurlEasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

[[nodiscard]] CurlEasyHandle makeEasyHandle();

// Connection-level failures (resolve, connect, TLS, timeouts, resets) as opposed
// to local or protocol errors.
[[nodiscard]] bool isTransportError(CURLcode code);

} // namespace dlqueue::detail
