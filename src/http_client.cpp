#include "bulkdl/http_client.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace bulkdl {

namespace {

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
        }
        spdlog::debug("using {}", curl_version());
    }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Function-local static: concurrent first calls initialize once, and a
// throwing init is retried by the next caller.
void requireCurlGlobal() {
    static CurlGlobal global;
}

int curlDebugCallback(CURL* /* handle */, curl_infotype type, char* data, size_t size, void* userptr) {
    auto* logger = static_cast<spdlog::logger*>(userptr);
    if (!logger) {
        return 0;
    }

    std::string_view text{data, size};
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    switch (type) {
        case CURLINFO_TEXT:
            logger->debug("* {}", text);
            break;
        case CURLINFO_HEADER_OUT:
            logger->debug("> {}", text);
            break;
        case CURLINFO_HEADER_IN:
            logger->debug("< {}", text);
            break;
        default:
            break;
    }
    return 0;
}

} // namespace

HttpClient::HttpClient(HttpOptions options)
    : options_(std::move(options)) {
    requireCurlGlobal();
    share_ = curl_share_init();
    if (!share_) {
        throw std::runtime_error("Failed to allocate curl share handle");
    }

    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &HttpClient::lockCallback);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &HttpClient::unlockCallback);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    if (curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT) != CURLSHE_OK) {
        spdlog::warn("libcurl cannot share connections; each task opens its own");
    }
}

HttpClient::~HttpClient() {
    if (share_) {
        curl_share_cleanup(share_);
    }
}

detail::CurlHandle HttpClient::newHandle(const std::string& url) const {
    detail::CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw std::runtime_error("Failed to allocate curl handle");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SHARE, share_);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (!options_.user_agent.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    }
    if (options_.connect_timeout_secs > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_secs);
    }
    if (options_.low_speed_time_secs > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.low_speed_time_secs);
    }

    if (options_.verbose) {
        auto logger = spdlog::get("libcurl");
        if (logger) {
            curl_easy_setopt(curl.get(), CURLOPT_DEBUGFUNCTION, &curlDebugCallback);
            curl_easy_setopt(curl.get(), CURLOPT_DEBUGDATA, logger.get());
            curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, 1L);
        }
    }

    return curl;
}

void HttpClient::lockCallback(CURL* /* handle */, curl_lock_data data, curl_lock_access /* access */,
                              void* userptr) {
    auto* self = static_cast<HttpClient*>(userptr);
    self->locks_[static_cast<std::size_t>(data)].lock();
}

void HttpClient::unlockCallback(CURL* /* handle */, curl_lock_data data, void* userptr) {
    auto* self = static_cast<HttpClient*>(userptr);
    self->locks_[static_cast<std::size_t>(data)].unlock();
}

} // namespace bulkdl
