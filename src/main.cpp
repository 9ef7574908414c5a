#include "bulkdl/cli.hpp"
#include "bulkdl/console_progress.hpp"
#include "bulkdl/curl_transfer.hpp"
#include "bulkdl/download_pool.hpp"
#include "bulkdl/errors.hpp"
#include "bulkdl/http_client.hpp"
#include "bulkdl/log_progress.hpp"
#include "bulkdl/logging.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>
#include <unistd.h>

namespace {

bulkdl::BatchReport runBatch(const bulkdl::Options& options, const bulkdl::TargetList& targets) {
    auto client = std::make_shared<const bulkdl::HttpClient>(options.http);
    bulkdl::CurlTransfer transfer(client);
    bulkdl::DownloadPool pool(options.connections);

    spdlog::info("downloading {} files to {} with {} connections",
                 targets.size(), options.output_dir, pool.workerCount());

    if (options.quiet || !isatty(STDOUT_FILENO)) {
        bulkdl::LogProgress sink;
        return pool.run(targets, options.output_dir, transfer, sink);
    }

    bulkdl::ConsoleProgress sink(std::cout, targets.size());
    auto report = pool.run(targets, options.output_dir, transfer, sink);
    sink.finish();
    return report;
}

} // namespace

int main(int argc, char** argv) {
    bulkdl::setupLogging(false);

    bulkdl::Options options;
    bulkdl::TargetList targets;
    try {
        options = bulkdl::parseArguments(argc, argv);
        if (options.show_help) {
            bulkdl::printUsage(std::cout, argv[0]);
            return 0;
        }
        bulkdl::setupLogging(options.http.verbose);
        targets = bulkdl::buildTargets(options);
    } catch (const bulkdl::ConfigurationError& ex) {
        spdlog::error("{}", ex.what());
        bulkdl::printUsage(std::cerr, argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        spdlog::critical("Fatal error: {}", ex.what());
        return 1;
    }

    try {
        std::error_code ec;
        std::filesystem::create_directories(options.output_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create output directory: "
                 + options.output_dir + " - " + ec.message());
        }

        const auto report = runBatch(options, targets);

        spdlog::info("{} of {} downloaded ({} bytes), {} failed",
                     report.succeeded, report.total, report.bytes_written, report.failed);
        for (const auto& failure : report.failures) {
            spdlog::warn("  #{} {}: {}", failure.index, failure.url, failure.message);
        }
    } catch (const std::exception& ex) {
        spdlog::critical("Fatal error: {}", ex.what());
        return 1;
    }
    return 0;
}
