#include "logging.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace systop {

void init_logging(const Options& options) {
    std::shared_ptr<spdlog::logger> logger;
    if (options.log_file.empty()) {
        logger = spdlog::null_logger_mt("systop");
    } else {
        // Throws spdlog::spdlog_ex when the file cannot be opened
        logger = spdlog::basic_logger_mt("systop", options.log_file);
    }

    logger->set_level(options.debug ? spdlog::level::debug : spdlog::level::info);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));

    spdlog::info("systop {} starting, interval {} ms, debug {}",
                 kVersion, options.refresh_interval.count(), options.debug);
}

} // namespace systop
