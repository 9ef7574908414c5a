#include "bulkdl/logging.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace bulkdl {

void setupLogging(bool verbose) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    const auto level = verbose ? spdlog::level::debug : spdlog::level::info;

    auto main_logger = std::make_shared<spdlog::logger>("bulkdl", sink);
    main_logger->set_level(level);
    main_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(main_logger);

    spdlog::drop("libcurl");
    auto curl_logger = std::make_shared<spdlog::logger>("libcurl", sink);
    curl_logger->set_level(level);
    curl_logger->set_pattern("[%H:%M:%S.%e] [curl] %v");
    spdlog::register_logger(curl_logger);
}

} // namespace bulkdl
