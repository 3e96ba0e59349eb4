#ifndef BTRFS_HPP
#define BTRFS_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace btrmig::fs {

// Parses `btrfs subvolume list` output into subvolume names, keeping tool order
auto parse_subvolume_list(std::string_view list_output) noexcept -> std::vector<std::string>;

// Lists subvolumes below the top level of mountpoint
auto btrfs_list_subvolumes(std::string_view mountpoint) noexcept -> std::vector<std::string>;

// Creates read-only snapshot of subvolume at snapshot_path
auto btrfs_create_snapshot(std::string_view subvolume_path, std::string_view snapshot_path) noexcept -> bool;

// Streams snapshot into destination directory with send/receive
auto btrfs_send_receive(std::string_view snapshot_path, std::string_view destination) noexcept -> bool;

// Deletes subvolume
auto btrfs_delete_subvol(std::string_view subvolume_path) noexcept -> bool;

// Sets or clears read-only property of subvolume
auto btrfs_set_readonly(std::string_view subvolume_path, bool readonly) noexcept -> bool;

}  // namespace btrmig::fs

#endif  // BTRFS_HPP
