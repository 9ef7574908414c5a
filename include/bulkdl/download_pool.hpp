#pragma once

#include "progress.hpp"
#include "targets.hpp"
#include "transfer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bulkdl {

struct PoolOptions {
    std::size_t max_workers{64};
    std::size_t default_workers{2};
};

// Requests of 0 or above options.max_workers fall back to options.default_workers.
[[nodiscard]] std::size_t clampWorkerCount(std::size_t requested, const PoolOptions& options = {});

struct TaskFailure {
    std::size_t index{0};
    std::string url;
    std::string message;
};

struct BatchReport {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::uint64_t bytes_written{0};
    std::vector<TaskFailure> failures;
};

// Fixed set of worker threads pulling indices from one shared atomic cursor.
class DownloadPool {
public:
    explicit DownloadPool(std::size_t worker_count, PoolOptions options = {});

    // Blocks until every index of targets has been attempted exactly once.
    BatchReport run(const TargetList& targets, const std::filesystem::path& output_dir,
                    Transfer& transfer, ProgressSink& sink);

    [[nodiscard]] std::size_t workerCount() const noexcept { return worker_count_; }

private:
    struct WorkerTally {
        std::size_t succeeded{0};
        std::uint64_t bytes_written{0};
        std::vector<TaskFailure> failures;
    };

    struct SharedState {
        const TargetList& targets;
        const std::filesystem::path& output_dir;
        Transfer& transfer;
        ProgressSink& sink;
        std::atomic<std::size_t> cursor{0};
        std::atomic<std::size_t> done{0};
    };

    static void workerLoop(SharedState& shared, WorkerTally& tally);

    std::size_t worker_count_;
};

} // namespace bulkdl
