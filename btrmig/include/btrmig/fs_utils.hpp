#ifndef FS_UTILS_HPP
#define FS_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace btrmig::fs::utils {

// Get FSTYPE of mountpoint, empty if path is not a mountpoint
auto get_mountpoint_fs(std::string_view mountpoint) noexcept -> std::string;

// Get SOURCE of mountpoint
auto get_mountpoint_source(std::string_view mountpoint) noexcept -> std::string;

// Checks that path is a mountpoint of a btrfs filesystem
auto is_btrfs_mountpoint(std::string_view mountpoint) noexcept -> bool;

}  // namespace btrmig::fs::utils

#endif  // FS_UTILS_HPP
