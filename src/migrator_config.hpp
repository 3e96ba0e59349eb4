#ifndef MIGRATOR_CONFIG_HPP
#define MIGRATOR_CONFIG_HPP

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace migrator {

/// Default log destination.
inline constexpr std::string_view kDefaultLogFile{"/tmp/btrmig.log"};

/// Settings of a migration run, merged from the settings file and the command line.
struct MigrationConfig {
    // Filesystems
    std::optional<std::string> source_mount{};
    std::optional<std::string> dest_mount{};

    // Behaviour
    bool dry_run{false};
    bool assume_yes{false};

    // Logging
    std::string log_file{kDefaultLogFile};
    bool verbose{false};
};

/// Options given on the command line, unset ones keep the settings file value.
struct CliOptions {
    std::optional<std::string> config_file{};
    std::optional<std::string> source_mount{};
    std::optional<std::string> dest_mount{};
    std::optional<std::string> log_file{};
    bool dry_run{false};
    bool assume_yes{false};
    bool verbose{false};
    bool help{false};
};

/// Parses migration settings from JSON string content.
/// @param json_content The JSON settings content.
/// @return MigrationConfig on success, or error string on failure.
[[nodiscard]] auto parse_migration_config(std::string_view json_content) noexcept
    -> std::expected<MigrationConfig, std::string>;

/// Applies command line options on top of the settings.
[[nodiscard]] auto merge_cli_options(MigrationConfig config, const CliOptions& options) noexcept -> MigrationConfig;

/// Validates that both mounts are given, absolute and distinct.
/// @param config The configuration to validate.
/// @return void on success, or error string describing the problem.
[[nodiscard]] auto validate_migration_config(const MigrationConfig& config) noexcept
    -> std::expected<void, std::string>;

/// Strips trailing slashes, "/" stays as is.
[[nodiscard]] auto normalize_mount_path(std::string_view path) noexcept -> std::string;

/// Returns default MigrationConfig.
[[nodiscard]] auto get_default_config() noexcept -> MigrationConfig;

}  // namespace migrator

#endif  // MIGRATOR_CONFIG_HPP
