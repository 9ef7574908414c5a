#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bulkdl {

// One claimed index. Lives only for the duration of Transfer::fetch.
struct Task {
    std::size_t index{0};
    const std::string& url;
    const std::filesystem::path& output_dir;
};

struct TransferResult {
    std::filesystem::path destination;
    std::uint64_t bytes_written{0};
    std::optional<std::uint64_t> declared_bytes;
};

// Fetch-and-persist of a single task. Throws TransferError or PersistenceError;
// reports bytes and completion through sink. Must be callable from several
// threads at once. DownloadPool records any other exception, std or not, as an
// "unexpected error" failure of that task.
class Transfer {
public:
    virtual ~Transfer() = default;

    virtual TransferResult fetch(const Task& task, ProgressSink& sink) = 0;
};

} // namespace bulkdl
