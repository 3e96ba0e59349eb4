#include "btrmig/fs_utils.hpp"
#include "btrmig/io_utils.hpp"

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace btrmig::fs::utils {

auto get_mountpoint_fs(std::string_view mountpoint) noexcept -> std::string {
    return btrmig::utils::exec_capture({"findmnt", "-ln", "-o", "FSTYPE", "--mountpoint", std::string{mountpoint}});
}

auto get_mountpoint_source(std::string_view mountpoint) noexcept -> std::string {
    return btrmig::utils::exec_capture({"findmnt", "-ln", "-o", "SOURCE", "--mountpoint", std::string{mountpoint}});
}

auto is_btrfs_mountpoint(std::string_view mountpoint) noexcept -> bool {
    const auto& fstype = fs::utils::get_mountpoint_fs(mountpoint);
    if (fstype.empty()) {
        spdlog::error("'{}' is not a mountpoint", mountpoint);
        return false;
    }
    if (fstype != "btrfs"sv) {
        spdlog::error("'{}' is mounted as '{}', expected btrfs", mountpoint, fstype);
        return false;
    }
    spdlog::debug("'{}' is btrfs mountpoint of '{}'", mountpoint, fs::utils::get_mountpoint_source(mountpoint));
    return true;
}

}  // namespace btrmig::fs::utils
