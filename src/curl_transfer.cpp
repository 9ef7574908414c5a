#include "bulkdl/curl_transfer.hpp"

#include "bulkdl/errors.hpp"
#include "bulkdl/filename.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace bulkdl {

class CurlTransfer::Impl {
public:
    explicit Impl(std::shared_ptr<const HttpClient> client) : client_(std::move(client)) {}

    TransferResult fetch(const Task& task, ProgressSink& sink) const {
        auto curl = client_->newHandle(task.url);

        TransferState state{task, sink, curl.get()};
        char error_buffer[CURL_ERROR_SIZE] = {};
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

        const CURLcode res = curl_easy_perform(curl.get());
        if (state.pending) {
            std::rethrow_exception(state.pending);
        }
        if (res != CURLE_OK) {
            const char* detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            throw TransferError(fmt::format("curl error {}: {}", static_cast<int>(res), detail));
        }

        // empty body: no chunk ever arrived
        if (!state.file) {
            openDestination(state);
        }

        FILE* file = state.file.release();
        if (std::fclose(file) != 0) {
            throw PersistenceError(fmt::format("cannot finish writing '{}': {}",
                                               state.destination.string(), std::strerror(errno)));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status >= 400) {
            spdlog::warn("{} answered HTTP {}; body saved as {}", task.url, status,
                         state.destination.string());
        }

        sink.taskFinished(task.index, true, {});
        return {state.destination, state.written, state.total};
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct TransferState {
        const Task& task;
        ProgressSink& sink;
        CURL* curl{nullptr};
        std::unique_ptr<FILE, FileDeleter> file{};
        std::filesystem::path destination{};
        std::uint64_t written{0};
        std::optional<std::uint64_t> total{};
        std::exception_ptr pending{};
    };

    static void openDestination(TransferState& state) {
        char* effective_url = nullptr;
        curl_easy_getinfo(state.curl, CURLINFO_EFFECTIVE_URL, &effective_url);
        const std::string filename = resolveFileName(effective_url ? effective_url : state.task.url);

        curl_off_t length = -1;
        if (curl_easy_getinfo(state.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
            length >= 0) {
            state.total = static_cast<std::uint64_t>(length);
        }

        state.destination = state.task.output_dir / filename;
        state.file.reset(std::fopen(state.destination.c_str(), "wb"));
        if (!state.file) {
            throw PersistenceError(fmt::format("cannot create '{}': {}",
                                               state.destination.string(), std::strerror(errno)));
        }

        spdlog::debug("[{}] {} -> {}", state.task.index, state.task.url, state.destination.string());
        state.sink.taskResolved(state.task.index, filename, state.total);
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        const size_t total = size * nmemb;

        // exceptions must not cross libcurl; they are rethrown after curl_easy_perform
        try {
            if (!state->file) {
                openDestination(*state);
            }
            if (total == 0) {
                return 0;
            }

            const size_t written = std::fwrite(ptr, 1, total, state->file.get());
            if (written != total) {
                throw PersistenceError(fmt::format("cannot write '{}': {}",
                                                   state->destination.string(), std::strerror(errno)));
            }

            state->written += written;
            state->sink.bytesTransferred(state->task.index, written);
            return written;
        } catch (...) {
            state->pending = std::current_exception();
            return 0;
        }
    }

    std::shared_ptr<const HttpClient> client_;
};

CurlTransfer::CurlTransfer(std::shared_ptr<const HttpClient> client)
    : impl_(std::make_unique<Impl>(std::move(client))) {}

CurlTransfer::~CurlTransfer() = default;

TransferResult CurlTransfer::fetch(const Task& task, ProgressSink& sink) { return impl_->fetch(task, sink); }

} // namespace bulkdl
