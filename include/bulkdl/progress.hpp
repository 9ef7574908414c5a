#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bulkdl {

// Snapshot of one task as seen by a renderer.
struct Progress {
    std::string url;
    std::string filename;
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
};

// Receiver of engine events. Called concurrently from worker threads, so
// implementations must be thread safe and must not block for long.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void taskStarted(std::size_t index, const std::string& url) = 0;
    // Destination name and declared length are known; total is empty when
    // the response carried no length.
    virtual void taskResolved(std::size_t index, const std::string& filename,
                              std::optional<std::uint64_t> total_bytes) = 0;
    virtual void bytesTransferred(std::size_t index, std::uint64_t bytes) = 0;
    virtual void taskFinished(std::size_t index, bool ok, const std::string& error) = 0;
    virtual void batchProgress(std::size_t done, std::size_t total) = 0;
};

class NullProgress final : public ProgressSink {
public:
    void taskStarted(std::size_t, const std::string&) override {}
    void taskResolved(std::size_t, const std::string&, std::optional<std::uint64_t>) override {}
    void bytesTransferred(std::size_t, std::uint64_t) override {}
    void taskFinished(std::size_t, bool, const std::string&) override {}
    void batchProgress(std::size_t, std::size_t) override {}
};

} // namespace bulkdl
