#include "bulkdl/download_pool.hpp"

#include "bulkdl/errors.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace bulkdl {

std::size_t clampWorkerCount(std::size_t requested, const PoolOptions& options) {
    if (requested == 0 || requested > options.max_workers) {
        const std::size_t fallback = options.default_workers > 0 ? options.default_workers : 1;
        spdlog::warn("{} workers requested, using {}", requested, fallback);
        return fallback;
    }
    return requested;
}

DownloadPool::DownloadPool(std::size_t worker_count, PoolOptions options)
    : worker_count_(clampWorkerCount(worker_count, options)) {}

BatchReport DownloadPool::run(const TargetList& targets, const std::filesystem::path& output_dir,
                              Transfer& transfer, ProgressSink& sink) {
    BatchReport report;
    report.total = targets.size();
    if (targets.empty()) {
        return report;
    }

    SharedState shared{targets, output_dir, transfer, sink};
    std::vector<WorkerTally> tallies(worker_count_);
    std::vector<std::thread> workers;
    workers.reserve(worker_count_);

    spdlog::debug("starting {} workers for {} targets", worker_count_, targets.size());
    for (std::size_t i = 0; i < worker_count_; ++i) {
        WorkerTally& tally = tallies[i];
        try {
            workers.emplace_back([&shared, &tally]() { workerLoop(shared, tally); });
        } catch (const std::system_error& e) {
            spdlog::warn("could only start {} of {} workers: {}", i, worker_count_, e.what());
            break;
        }
    }
    if (workers.empty()) {
        workerLoop(shared, tallies.front());
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    for (auto& tally : tallies) {
        report.succeeded += tally.succeeded;
        report.bytes_written += tally.bytes_written;
        for (auto& failure : tally.failures) {
            report.failures.push_back(std::move(failure));
        }
    }
    report.failed = report.failures.size();
    return report;
}

void DownloadPool::workerLoop(SharedState& shared, WorkerTally& tally) {
    const std::size_t total = shared.targets.size();
    while (true) {
        const std::size_t index = shared.cursor.fetch_add(1, std::memory_order_relaxed);
        if (index >= total) {
            return;
        }

        const std::string& url = shared.targets[index];
        shared.sink.taskStarted(index, url);

        bool failed = false;
        std::string error;
        try {
            const Task task{index, url, shared.output_dir};
            const TransferResult result = shared.transfer.fetch(task, shared.sink);
            ++tally.succeeded;
            tally.bytes_written += result.bytes_written;
        } catch (const DownloadError& e) {
            failed = true;
            error = e.what();
        } catch (const std::exception& e) {
            failed = true;
            error = fmt::format("unexpected error: {}", e.what());
        } catch (...) {
            // not derived from std::exception
            failed = true;
            error = "unexpected error: unknown exception";
        }

        if (failed) {
            spdlog::error("[{}] {} failed: {}", index, url, error);
            shared.sink.taskFinished(index, false, error);
            tally.failures.push_back({index, url, std::move(error)});
        }

        const std::size_t done = shared.done.fetch_add(1, std::memory_order_acq_rel) + 1;
        shared.sink.batchProgress(done, total);
    }
}

} // namespace bulkdl
