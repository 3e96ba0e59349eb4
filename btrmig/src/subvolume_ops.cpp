#include "btrmig/subvolume_ops.hpp"
#include "btrmig/btrfs.hpp"

#include <chrono>        // for system_clock
#include <filesystem>    // for exists, is_directory, rename
#include <system_error>  // for error_code

#include <fmt/ranges.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace btrmig::fs {

auto dry_run_subvolumes() noexcept -> std::vector<std::string> {
    return {"@", "@home", "@var", "@tmp", "@snapshots"};
}

auto BtrfsSubvolumeOps::list_subvolumes(std::string_view mountpoint) noexcept -> std::vector<std::string> {
    if (m_dry_run) {
        auto subvolumes = fs::dry_run_subvolumes();
        spdlog::info("[DRY RUN] Simulating subvolumes: {}", fmt::join(subvolumes, " "));
        return subvolumes;
    }
    return fs::btrfs_list_subvolumes(mountpoint);
}

auto BtrfsSubvolumeOps::is_directory(std::string_view path) noexcept -> bool {
    if (m_dry_run) {
        return true;
    }
    std::error_code err{};
    const bool is_dir = std::filesystem::is_directory(std::filesystem::path{path}, err);
    if (err) {
        spdlog::debug("Failed to stat '{}': {}", path, err.message());
        return false;
    }
    return is_dir;
}

auto BtrfsSubvolumeOps::create_snapshot(std::string_view subvolume_path, std::string_view snapshot_path) noexcept -> bool {
    if (m_dry_run) {
        spdlog::info("[DRY RUN] Would execute: btrfs subvolume snapshot -r {} {}", subvolume_path, snapshot_path);
        return true;
    }
    return fs::btrfs_create_snapshot(subvolume_path, snapshot_path);
}

auto BtrfsSubvolumeOps::send_receive(std::string_view snapshot_path, std::string_view destination) noexcept -> bool {
    if (m_dry_run) {
        spdlog::info("[DRY RUN] Would execute: btrfs send {} | btrfs receive {}", snapshot_path, destination);
        return true;
    }
    return fs::btrfs_send_receive(snapshot_path, destination);
}

auto BtrfsSubvolumeOps::rename_subvolume(std::string_view from, std::string_view to) noexcept -> bool {
    if (m_dry_run) {
        spdlog::info("[DRY RUN] Would execute: mv {} {}", from, to);
        return true;
    }

    const std::filesystem::path target{to};
    std::error_code err{};
    // rename(2) silently replaces an empty directory
    if (std::filesystem::exists(target, err)) {
        spdlog::error("Cannot rename '{}': '{}' already exists", from, to);
        return false;
    }
    std::filesystem::rename(std::filesystem::path{from}, target, err);
    if (err) {
        spdlog::error("Failed to rename '{}' to '{}': {}", from, to, err.message());
        return false;
    }
    return true;
}

auto BtrfsSubvolumeOps::make_writable(std::string_view subvolume_path) noexcept -> bool {
    if (m_dry_run) {
        spdlog::info("[DRY RUN] Would execute: btrfs property set -ts {} ro false", subvolume_path);
        return true;
    }
    return fs::btrfs_set_readonly(subvolume_path, false);
}

auto BtrfsSubvolumeOps::delete_subvolume(std::string_view subvolume_path) noexcept -> bool {
    if (m_dry_run) {
        spdlog::info("[DRY RUN] Would execute: btrfs subvolume delete {}", subvolume_path);
        return true;
    }
    return fs::btrfs_delete_subvol(subvolume_path);
}

auto BtrfsSubvolumeOps::unix_timestamp() noexcept -> std::int64_t {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

}  // namespace btrmig::fs
