#include "bulkdl/log_progress.hpp"

#include "bulkdl/detail/format_size.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace bulkdl {

void LogProgress::taskStarted(std::size_t index, const std::string& url) {
    spdlog::debug("[{}] GET {}", index, url);
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[index] = Entry{};
}

void LogProgress::taskResolved(std::size_t index, const std::string& filename,
                               std::optional<std::uint64_t> total_bytes) {
    if (total_bytes) {
        spdlog::debug("[{}] saving {} ({})", index, filename, detail::formatSize(*total_bytes));
    } else {
        spdlog::debug("[{}] saving {} (size unknown)", index, filename);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[index].filename = filename;
}

void LogProgress::bytesTransferred(std::size_t index, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[index].bytes += bytes;
}

void LogProgress::taskFinished(std::size_t index, bool ok, const std::string& /* error */) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(index);
        if (it != entries_.end()) {
            entry = std::move(it->second);
            entries_.erase(it);
        }
    }
    // the pool already logs failures with their cause
    if (ok) {
        spdlog::info("[{}] saved {} ({})", index, entry.filename, detail::formatSize(entry.bytes));
    }
}

void LogProgress::batchProgress(std::size_t done, std::size_t total) {
    spdlog::debug("{} / {} tasks done", done, total);
}

} // namespace bulkdl
