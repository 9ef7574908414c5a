#pragma once

#include <array>
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

namespace bulkdl {

namespace detail {
using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
} // namespace detail

struct HttpOptions {
    long connect_timeout_secs{30};
    // Abort when the rate stays below low_speed_limit bytes/s for low_speed_time_secs. 0 disables.
    long low_speed_limit{1};
    long low_speed_time_secs{60};
    long max_redirects{20};
    std::string user_agent{"bulkdl/1.0"};
    bool verbose{false};
};

// Process-wide client shared by every task. Connections, DNS results and TLS
// sessions are pooled through a libcurl share handle. The first client
// constructed runs curl_global_init; cleanup happens at process exit.
class HttpClient {
public:
    explicit HttpClient(HttpOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Easy handle for a GET of url, attached to the share and following redirects.
    [[nodiscard]] detail::CurlHandle newHandle(const std::string& url) const;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

private:
    static void lockCallback(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlockCallback(CURL* handle, curl_lock_data data, void* userptr);

    HttpOptions options_;
    CURLSH* share_{nullptr};
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
};

} // namespace bulkdl
