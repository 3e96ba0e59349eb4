#include "btrmig/btrfs.hpp"
#include "btrmig/io_utils.hpp"
#include "btrmig/string_utils.hpp"

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace btrmig::fs {

auto parse_subvolume_list(std::string_view list_output) noexcept -> std::vector<std::string> {
    static constexpr auto kPathToken   = " path "sv;
    static constexpr auto kFsTreeToken = "<FS_TREE>/"sv;

    std::vector<std::string> subvolumes{};
    for (auto&& line : utils::make_split_view(list_output)) {
        // e.g format: ID 257 gen 9 top level 5 path @home
        const auto pos = line.find(kPathToken);
        if (pos == std::string_view::npos) {
            continue;
        }
        auto name = line.substr(pos + kPathToken.size());
        if (name.starts_with(kFsTreeToken)) {
            name.remove_prefix(kFsTreeToken.size());
        }
        // names may legitimately contain spaces, only strip line ending
        while (!name.empty() && (name.back() == '\r' || name.back() == '\n')) {
            name.remove_suffix(1);
        }
        if (!name.empty()) {
            subvolumes.emplace_back(name);
        }
    }
    return subvolumes;
}

auto btrfs_list_subvolumes(std::string_view mountpoint) noexcept -> std::vector<std::string> {
    const auto& list_output = utils::exec_capture({"btrfs", "subvolume", "list", "-o", std::string{mountpoint}});
    auto subvolumes         = fs::parse_subvolume_list(list_output);
    spdlog::debug("Found {} subvolumes on {}", subvolumes.size(), mountpoint);
    return subvolumes;
}

auto btrfs_create_snapshot(std::string_view subvolume_path, std::string_view snapshot_path) noexcept -> bool {
    return utils::exec({"btrfs", "subvolume", "snapshot", "-r", std::string{subvolume_path}, std::string{snapshot_path}});
}

auto btrfs_send_receive(std::string_view snapshot_path, std::string_view destination) noexcept -> bool {
    return utils::exec_pipeline({"btrfs", "send", "-q", std::string{snapshot_path}}, {"btrfs", "receive", "-q", std::string{destination}});
}

auto btrfs_delete_subvol(std::string_view subvolume_path) noexcept -> bool {
    return utils::exec({"btrfs", "subvolume", "delete", std::string{subvolume_path}});
}

auto btrfs_set_readonly(std::string_view subvolume_path, bool readonly) noexcept -> bool {
    return utils::exec({"btrfs", "property", "set", "-ts", std::string{subvolume_path}, "ro", readonly ? "true" : "false"});
}

}  // namespace btrmig::fs
