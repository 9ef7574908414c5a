#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bulkdl {

// Progress reported as log lines, for quiet runs and non-terminal output.
class LogProgress final : public ProgressSink {
public:
    void taskStarted(std::size_t index, const std::string& url) override;
    void taskResolved(std::size_t index, const std::string& filename,
                      std::optional<std::uint64_t> total_bytes) override;
    void bytesTransferred(std::size_t index, std::uint64_t bytes) override;
    void taskFinished(std::size_t index, bool ok, const std::string& error) override;
    void batchProgress(std::size_t done, std::size_t total) override;

private:
    struct Entry {
        std::string filename;
        std::uint64_t bytes{0};
    };

    std::mutex mutex_;
    std::unordered_map<std::size_t, Entry> entries_;
};

} // namespace bulkdl
