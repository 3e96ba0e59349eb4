#ifndef SUBVOLUME_OPS_HPP
#define SUBVOLUME_OPS_HPP

#include <cstdint>      // for int64_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace btrmig::fs {

/// @brief Filesystem operations used by the migration driver.
///
/// Every mutating call is synchronous and reports success as bool.
/// Implementations must not throw.
class SubvolumeOps {
 public:
    SubvolumeOps() noexcept          = default;
    virtual ~SubvolumeOps() noexcept = default;

    SubvolumeOps(const SubvolumeOps&)                    = delete;
    auto operator=(const SubvolumeOps&) -> SubvolumeOps& = delete;

    /// @brief Lists subvolume names below the top level of mountpoint.
    virtual auto list_subvolumes(std::string_view mountpoint) noexcept -> std::vector<std::string> = 0;

    /// @brief Whether path exists and is a directory.
    virtual auto is_directory(std::string_view path) noexcept -> bool = 0;

    /// @brief Creates a read-only snapshot of subvolume_path at snapshot_path.
    virtual auto create_snapshot(std::string_view subvolume_path, std::string_view snapshot_path) noexcept -> bool = 0;

    /// @brief Sends snapshot and receives it into destination directory.
    virtual auto send_receive(std::string_view snapshot_path, std::string_view destination) noexcept -> bool = 0;

    /// @brief Renames subvolume, fails if target already exists.
    virtual auto rename_subvolume(std::string_view from, std::string_view to) noexcept -> bool = 0;

    /// @brief Clears read-only flag left by receive.
    virtual auto make_writable(std::string_view subvolume_path) noexcept -> bool = 0;

    /// @brief Deletes subvolume.
    virtual auto delete_subvolume(std::string_view subvolume_path) noexcept -> bool = 0;

    /// @brief Current unix time in seconds, used to name snapshots.
    virtual auto unix_timestamp() noexcept -> std::int64_t = 0;
};

/// @brief SubvolumeOps backed by btrfs-progs.
///
/// In dry-run mode no command is executed: mutating calls are logged and
/// succeed, and the listing is a fixed simulated set.
class BtrfsSubvolumeOps final : public SubvolumeOps {
 public:
    explicit BtrfsSubvolumeOps(bool dry_run = false) noexcept : m_dry_run(dry_run) { }

    auto list_subvolumes(std::string_view mountpoint) noexcept -> std::vector<std::string> override;
    auto is_directory(std::string_view path) noexcept -> bool override;
    auto create_snapshot(std::string_view subvolume_path, std::string_view snapshot_path) noexcept -> bool override;
    auto send_receive(std::string_view snapshot_path, std::string_view destination) noexcept -> bool override;
    auto rename_subvolume(std::string_view from, std::string_view to) noexcept -> bool override;
    auto make_writable(std::string_view subvolume_path) noexcept -> bool override;
    auto delete_subvolume(std::string_view subvolume_path) noexcept -> bool override;
    auto unix_timestamp() noexcept -> std::int64_t override;

    [[nodiscard]] auto is_dry_run() const noexcept -> bool { return m_dry_run; }

 private:
    bool m_dry_run{false};
};

/// @brief Listing reported in dry-run mode.
auto dry_run_subvolumes() noexcept -> std::vector<std::string>;

}  // namespace btrmig::fs

#endif  // SUBVOLUME_OPS_HPP
