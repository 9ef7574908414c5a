#pragma once

#include <string>
#include <string_view>

namespace bulkdl {

// Last non-empty path segment of url, percent-decoded. Falls back to
// synthesizeFileName() when the path has no such segment.
[[nodiscard]] std::string resolveFileName(std::string_view url);

[[nodiscard]] std::string percentDecode(std::string_view text);

// Milliseconds since the Unix epoch. Strictly increasing within the process.
[[nodiscard]] std::string synthesizeFileName();

} // namespace bulkdl
