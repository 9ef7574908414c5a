#include "bulkdl/console_progress.hpp"

#include "bulkdl/detail/format_size.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/format.h>

namespace bulkdl {

namespace {

constexpr int kBarWidth = 30;

std::string renderBar(double ratio) {
    const int bar_pos = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }
    return bar;
}

} // namespace

ConsoleProgress::ConsoleProgress(std::ostream& out, std::size_t task_count, std::chrono::milliseconds interval)
    : out_(out),
      interval_(interval),
      started_(std::chrono::steady_clock::now()),
      total_(task_count),
      render_thread_([this]() { renderLoop(); }) {}

ConsoleProgress::~ConsoleProgress() { finish(); }

void ConsoleProgress::taskStarted(std::size_t index, const std::string& url) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    Progress& progress = active_[index];
    progress.url = url;
    progress.is_running = true;
}

void ConsoleProgress::taskResolved(std::size_t index, const std::string& filename,
                                   std::optional<std::uint64_t> total_bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    Progress& progress = active_[index];
    progress.filename = filename;
    progress.total_bytes = total_bytes;
}

void ConsoleProgress::bytesTransferred(std::size_t index, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    active_[index].downloaded_bytes += bytes;
}

void ConsoleProgress::taskFinished(std::size_t index, bool /* ok */, const std::string& /* error */) {
    // failures are reported by the log; the row simply leaves the panel
    std::lock_guard<std::mutex> lock(state_mutex_);
    active_.erase(index);
}

void ConsoleProgress::batchProgress(std::size_t done, std::size_t total) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    done_ = std::max(done_, done);
    total_ = total;
}

void ConsoleProgress::finish() {
    {
        std::lock_guard<std::mutex> lock(render_mutex_);
        stop_ = true;
    }
    render_cv_.notify_all();
    if (render_thread_.joinable()) {
        render_thread_.join();
    }
}

std::string ConsoleProgress::buildPanel() const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    std::string panel;
    panel.reserve(active_.size() * 128 + 256);
    for (const auto& entry : active_) {
        panel += formatTaskLine(entry.second);
        panel.push_back('\n');
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count();
    const double ratio = total_ > 0 ? static_cast<double>(done_) / static_cast<double>(total_) : 1.0;
    panel += fmt::format("{:02}:{:02}:{:02} [{}] {} / {} {:>3}%\n",
                         elapsed / 3600, (elapsed / 60) % 60, elapsed % 60,
                         renderBar(ratio), done_, total_, static_cast<int>(ratio * 100.0));
    return panel;
}

std::string ConsoleProgress::formatTaskLine(const Progress& progress) {
    std::string display_name = progress.filename;
    if (display_name.empty()) {
        display_name = std::filesystem::path{progress.url}.filename().string();
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes && *progress.total_bytes > 0) {
        const double ratio = static_cast<double>(progress.downloaded_bytes) /
                             static_cast<double>(*progress.total_bytes);
        return fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                           display_name,
                           renderBar(ratio),
                           static_cast<int>(std::min(ratio, 1.0) * 100.0),
                           detail::formatSize(progress.downloaded_bytes),
                           detail::formatSize(*progress.total_bytes));
    }
    if (progress.filename.empty()) {
        return fmt::format("{:<20} [Connecting...]", display_name);
    }
    return fmt::format("{:<20} {}", display_name, detail::formatSize(progress.downloaded_bytes));
}

void ConsoleProgress::renderLoop() {
    std::unique_lock<std::mutex> lock(render_mutex_);
    while (true) {
        lock.unlock();
        redrawPanel(buildPanel());
        lock.lock();

        if (stop_) {
            break;
        }
        render_cv_.wait_for(lock, interval_, [this]() { return stop_; });
    }
    out_ << std::flush;
}

void ConsoleProgress::redrawPanel(const std::string& panel) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace bulkdl
