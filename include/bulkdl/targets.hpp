#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bulkdl {

// Ordered list of addresses. Built once before the pool starts and only read afterwards.
using TargetList = std::vector<std::string>;

inline constexpr std::string_view kPlaceholder = "{}";

// Replaces every "{}" in tmpl with each integer of the inclusive range [start, end].
// Throws ConfigurationError when start > end or when tmpl has no placeholder.
[[nodiscard]] TargetList expandTemplate(const std::string& tmpl, std::int64_t start, std::int64_t end);

// One address per line; trailing CR/LF stripped, empty lines skipped.
// Throws ConfigurationError when the file cannot be read.
[[nodiscard]] TargetList readTargetFile(const std::string& path);

} // namespace bulkdl
