#include "bulkdl/filename.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <curl/curl.h>

namespace bulkdl {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Raw (still percent-encoded) path of url, or empty when it cannot be parsed.
std::string urlPath(std::string_view url) {
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        return {};
    }

    const std::string input{url};
    if (curl_url_set(handle.get(), CURLUPART_URL, input.c_str(),
                     CURLU_NON_SUPPORT_SCHEME | CURLU_GUESS_SCHEME) != CURLUE_OK) {
        return {};
    }

    char* path = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_PATH, &path, 0) != CURLUE_OK || !path) {
        return {};
    }
    std::string result{path};
    curl_free(path);
    return result;
}

} // namespace

std::string percentDecode(std::string_view text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::string synthesizeFileName() {
    static std::atomic<std::int64_t> last_issued{0};

    const std::int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::int64_t previous = last_issued.load(std::memory_order_relaxed);
    std::int64_t candidate = 0;
    do {
        candidate = now > previous ? now : previous + 1;
    } while (!last_issued.compare_exchange_weak(previous, candidate, std::memory_order_relaxed));

    return std::to_string(candidate);
}

std::string resolveFileName(std::string_view url) {
    const std::string path = urlPath(url);

    std::size_t end = path.size();
    while (end > 0 && path[end - 1] == '/') {
        --end;
    }
    if (end > 0) {
        const std::size_t slash = path.rfind('/', end - 1);
        const std::size_t begin = slash == std::string::npos ? 0 : slash + 1;
        std::string name = percentDecode(std::string_view{path}.substr(begin, end - begin));
        // a decoded segment must stay a single entry inside the output directory
        for (char& c : name) {
            if (c == '/' || c == '\\' || c == '\0') {
                c = '_';
            }
        }
        if (!name.empty() && name != "." && name != "..") {
            return name;
        }
    }
    return synthesizeFileName();
}

} // namespace bulkdl
