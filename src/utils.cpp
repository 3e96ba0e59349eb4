#include "utils.hpp"

// import btrmig
#include "btrmig/file_utils.hpp"
#include "btrmig/fs_utils.hpp"
#include "btrmig/io_utils.hpp"
#include "btrmig/string_utils.hpp"

#include <expected>  // for expected, unexpected

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace utils {

bool check_root() noexcept {
    return btrmig::utils::trim(btrmig::utils::exec_capture({"whoami"})) == "root"sv;
}

auto load_settings(std::string_view file_path) noexcept -> std::expected<migrator::MigrationConfig, std::string> {
    if (!btrmig::file_utils::file_exists(file_path)) {
        return std::unexpected(fmt::format(FMT_COMPILE("settings file '{}' not found"), file_path));
    }
    const auto& content = btrmig::file_utils::read_whole_file(file_path);
    auto config         = migrator::parse_migration_config(content);
    if (!config) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}': {}"), file_path, config.error()));
    }
    return config;
}

bool preflight_checks(const migrator::MigrationConfig& config) noexcept {
    if (!utils::check_root()) {
        spdlog::error("Migration must be launched with root privileges");
        return false;
    }

    // both checks run so that every problem is logged
    const bool source_ok = btrmig::fs::utils::is_btrfs_mountpoint(*config.source_mount);
    const bool dest_ok   = btrmig::fs::utils::is_btrfs_mountpoint(*config.dest_mount);
    if (!source_ok || !dest_ok) {
        return false;
    }

    spdlog::info("Source '{}' is backed by '{}'", *config.source_mount, btrmig::fs::utils::get_mountpoint_source(*config.source_mount));
    spdlog::info("Destination '{}' is backed by '{}'", *config.dest_mount, btrmig::fs::utils::get_mountpoint_source(*config.dest_mount));
    return true;
}

void dump_settings_to_log(const migrator::MigrationConfig& config) noexcept {
    std::string out{};
    out += fmt::format(FMT_COMPILE("Option: [source_mount], Value: [{}]\n"), config.source_mount.value_or(""));
    out += fmt::format(FMT_COMPILE("Option: [dest_mount], Value: [{}]\n"), config.dest_mount.value_or(""));
    out += fmt::format(FMT_COMPILE("Option: [dry_run], Value: [{}]\n"), config.dry_run);
    out += fmt::format(FMT_COMPILE("Option: [assume_yes], Value: [{}]\n"), config.assume_yes);
    out += fmt::format(FMT_COMPILE("Option: [log_file], Value: [{}]\n"), config.log_file);
    out += fmt::format(FMT_COMPILE("Option: [verbose], Value: [{}]\n"), config.verbose);
    spdlog::info("Settings:\n{}", out);
}

}  // namespace utils
