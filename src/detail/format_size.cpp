#include "bulkdl/detail/format_size.hpp"

#include <fmt/format.h>

namespace bulkdl::detail {

std::string formatSize(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = KB * 1024;
    constexpr std::uint64_t GB = MB * 1024;

    const double value = static_cast<double>(bytes);
    if (bytes >= GB) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= MB) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= KB) {
        return fmt::format("{:.1f} KB", value / KB);
    }
    return fmt::format("{} B", bytes);
}

} // namespace bulkdl::detail
