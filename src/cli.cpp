#include "bulkdl/cli.hpp"

#include "bulkdl/errors.hpp"

#include <exception>

#include <fmt/format.h>

namespace bulkdl {

namespace {

std::int64_t parseInteger(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError(fmt::format("{} expects an integer, got '{}'", option, value));
    }
    if (consumed != value.size()) {
        throw ConfigurationError(fmt::format("{} expects an integer, got '{}'", option, value));
    }
    return static_cast<std::int64_t>(parsed);
}

std::int64_t parseNonNegative(const std::string& option, const std::string& value) {
    const std::int64_t parsed = parseInteger(option, value);
    if (parsed < 0) {
        throw ConfigurationError(fmt::format("{} must not be negative", option));
    }
    return parsed;
}

} // namespace

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " (-u <template> -e <end> [-s <start>] | -f <list>) [options]\n"
        << "Options:\n"
        << "  -u, --url <template>        Address containing {} replaced by each number\n"
        << "  -s, --start <n>             First number (default: 1)\n"
        << "  -e, --end <n>               Last number, inclusive\n"
        << "  -f, --file <path>           Read addresses from a file, one per line\n"
        << "  -o, --output <dir>          Output directory (default: ./)\n"
        << "  -c, --connections <n>       Parallel downloads (default: 2)\n"
        << "      --connect-timeout <s>   Connection timeout in seconds, 0 for none (default: 30)\n"
        << "      --low-speed-time <s>    Abort a stalled transfer after s seconds, 0 for never (default: 60)\n"
        << "  -q, --quiet                 Log completed files instead of drawing progress bars\n"
        << "  -v, --verbose               Debug logging, including the HTTP exchange\n"
        << "  -h, --help                  Show this message" << std::endl;
}

Options parseArguments(int argc, const char* const* argv) {
    Options options;
    int arg_index = 1;

    const auto nextValue = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw ConfigurationError(fmt::format("{} requires a value", option));
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-u" || option == "--url") {
            options.url_template = nextValue(option);
        } else if (option == "-s" || option == "--start") {
            options.start = parseInteger(option, nextValue(option));
        } else if (option == "-e" || option == "--end") {
            options.end = parseInteger(option, nextValue(option));
        } else if (option == "-f" || option == "--file") {
            options.list_file = nextValue(option);
        } else if (option == "-o" || option == "--output") {
            options.output_dir = nextValue(option);
            if (options.output_dir.empty()) {
                throw ConfigurationError("output directory must not be empty");
            }
        } else if (option == "-c" || option == "--connections") {
            const std::int64_t connections = parseNonNegative(option, nextValue(option));
            if (connections == 0) {
                throw ConfigurationError("at least one connection is required");
            }
            options.connections = static_cast<std::size_t>(connections);
        } else if (option == "--connect-timeout") {
            options.http.connect_timeout_secs = static_cast<long>(parseNonNegative(option, nextValue(option)));
        } else if (option == "--low-speed-time") {
            options.http.low_speed_time_secs = static_cast<long>(parseNonNegative(option, nextValue(option)));
        } else if (option == "-q" || option == "--quiet") {
            options.quiet = true;
            ++arg_index;
        } else if (option == "-v" || option == "--verbose") {
            options.http.verbose = true;
            ++arg_index;
        } else if (option == "-h" || option == "--help") {
            options.show_help = true;
            return options;
        } else {
            throw ConfigurationError(fmt::format("unknown argument '{}'", option));
        }
    }

    if (options.url_template.empty() == options.list_file.empty()) {
        throw ConfigurationError("exactly one of --url or --file is required");
    }
    if (!options.url_template.empty() && !options.end) {
        throw ConfigurationError("--url requires --end");
    }
    return options;
}

TargetList buildTargets(const Options& options) {
    if (!options.list_file.empty()) {
        return readTargetFile(options.list_file);
    }
    if (!options.end) {
        throw ConfigurationError("--url requires --end");
    }
    return expandTemplate(options.url_template, options.start, *options.end);
}

} // namespace bulkdl
