#pragma once

#include <cstdint>
#include <string>

namespace bulkdl::detail {

// Human-readable byte count: "512 B", "1.5 KB", "3.0 GB".
std::string formatSize(std::uint64_t bytes);

} // namespace bulkdl::detail
