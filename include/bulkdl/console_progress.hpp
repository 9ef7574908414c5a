#pragma once

#include "progress.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace bulkdl {

// Live panel of active tasks plus an overall line, redrawn in place by a
// background thread.
class ConsoleProgress final : public ProgressSink {
public:
    explicit ConsoleProgress(std::ostream& out, std::size_t task_count,
                             std::chrono::milliseconds interval = std::chrono::milliseconds(200));
    ~ConsoleProgress() override;

    ConsoleProgress(const ConsoleProgress&) = delete;
    ConsoleProgress& operator=(const ConsoleProgress&) = delete;

    void taskStarted(std::size_t index, const std::string& url) override;
    void taskResolved(std::size_t index, const std::string& filename,
                      std::optional<std::uint64_t> total_bytes) override;
    void bytesTransferred(std::size_t index, std::uint64_t bytes) override;
    void taskFinished(std::size_t index, bool ok, const std::string& error) override;
    void batchProgress(std::size_t done, std::size_t total) override;

    // Stops the render thread after drawing the final state. Idempotent.
    void finish();

    [[nodiscard]] std::string buildPanel() const;

    static std::string formatTaskLine(const Progress& progress);

private:
    void renderLoop();
    void redrawPanel(const std::string& panel);

    std::ostream& out_;
    const std::chrono::milliseconds interval_;
    const std::chrono::steady_clock::time_point started_;

    mutable std::mutex state_mutex_;
    std::map<std::size_t, Progress> active_;
    std::size_t done_{0};
    std::size_t total_;

    std::mutex render_mutex_;
    std::condition_variable render_cv_;
    bool stop_{false};
    std::size_t previous_lines_{0};
    std::thread render_thread_;
};

} // namespace bulkdl
