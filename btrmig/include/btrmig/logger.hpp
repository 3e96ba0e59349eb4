#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>       // for shared_ptr
#include <string_view>  // for string_view

#include <spdlog/spdlog.h>

namespace btrmig::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

/// @brief Creates async file logger with the migration log pattern.
/// @param name Logger name registered in spdlog.
/// @param log_path File to append log records to.
/// @param verbose Enables debug level.
/// @return Logger, or nullptr if the log file cannot be opened.
auto make_file_logger(std::string_view name, std::string_view log_path, bool verbose) noexcept -> std::shared_ptr<spdlog::logger>;

}  // namespace btrmig::logger

#endif  // LOGGER_HPP
