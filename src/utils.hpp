#ifndef UTILS_HPP
#define UTILS_HPP

#include "migrator_config.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace utils {

[[nodiscard]] bool check_root() noexcept;

/// Reads and parses the JSON settings file.
[[nodiscard]] auto load_settings(std::string_view file_path) noexcept -> std::expected<migrator::MigrationConfig, std::string>;

/// Root check and btrfs mountpoint checks of both filesystems.
[[nodiscard]] bool preflight_checks(const migrator::MigrationConfig& config) noexcept;

void dump_settings_to_log(const migrator::MigrationConfig& config) noexcept;

}  // namespace utils

#endif  // UTILS_HPP
