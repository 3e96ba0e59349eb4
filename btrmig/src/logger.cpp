#include "btrmig/logger.hpp"

#include <chrono>   // for seconds
#include <cstdio>   // for stderr
#include <string>   // for string
#include <utility>  // for move

#include <spdlog/async.h>                  // for create_async
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt

#include <fmt/core.h>

namespace btrmig::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

auto make_file_logger(std::string_view name, std::string_view log_path, bool verbose) noexcept -> std::shared_ptr<spdlog::logger> {
    std::shared_ptr<spdlog::logger> logger{};
    try {
        logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>(std::string{name}, std::string{log_path});
    } catch (const spdlog::spdlog_ex& ex) {
        fmt::print(stderr, "Failed to open log file '{}': {}\n", log_path, ex.what());
        return nullptr;
    }

    logger->set_pattern("[%r][%^---%L---%$] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::err);
    spdlog::flush_every(std::chrono::seconds(5));
    return logger;
}

}  // namespace btrmig::logger
