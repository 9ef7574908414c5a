#pragma once

#include "http_client.hpp"
#include "targets.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace bulkdl {

struct Options {
    std::string url_template;
    std::string list_file;
    std::int64_t start{1};
    std::optional<std::int64_t> end;
    std::string output_dir{"./"};
    std::size_t connections{2};
    HttpOptions http;
    bool quiet{false};
    bool show_help{false};
};

// Throws ConfigurationError on unknown options, missing values or malformed numbers.
[[nodiscard]] Options parseArguments(int argc, const char* const* argv);

// Expands the template range or reads the list file named by options.
[[nodiscard]] TargetList buildTargets(const Options& options);

void printUsage(std::ostream& out, const char* program_name);

} // namespace bulkdl
