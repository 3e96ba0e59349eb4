#ifndef MIGRATION_HPP
#define MIGRATION_HPP

#include "btrmig/skip_policy.hpp"
#include "btrmig/subvolume_ops.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for uint8_t, int64_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace btrmig::migration {

/// Terminal state of a single subvolume.
enum class MigrationStatus : std::uint8_t {
    Migrated,
    Failed,
    Skipped,
};

/// Per-subvolume failure, never aborts the run.
enum class FailureKind : std::uint8_t {
    SourcePathMissing,
    SnapshotCreationFailed,
    TransferFailed,
    ReceivedSubvolumeMissing,
    RenameFailed,
};

/// Failure aborting the whole run before any mutation.
enum class MigrationError : std::uint8_t {
    NoSubvolumesFound,
};

struct SubvolumeResult final {
    std::string subvolume{};
    MigrationStatus status{MigrationStatus::Failed};
    /// Set only for Failed.
    std::optional<FailureKind> failure{};
    /// Set only for Skipped.
    std::optional<policy::SkipRule> skip_rule{};
    /// Advisory problems of a migrated subvolume (e.g. stray snapshot).
    std::vector<std::string> warnings{};

    [[nodiscard]] auto reason() const noexcept -> std::string_view;
};

struct RunSummary final {
    std::size_t total{};
    std::size_t migrated{};
    std::size_t failed{};
    std::size_t skipped{};
    std::vector<SubvolumeResult> results{};

    /// Skipped subvolumes alone are not a failure.
    [[nodiscard]] auto succeeded() const noexcept -> bool { return failed == 0; }
};

auto status_to_string(MigrationStatus status) noexcept -> std::string_view;
auto failure_kind_to_string(FailureKind kind) noexcept -> std::string_view;
auto migration_error_to_string(MigrationError error) noexcept -> std::string_view;

/// @brief Name of the ephemeral transfer snapshot, e.g. "@home_snapshot_1700000000".
auto make_snapshot_name(std::string_view subvolume, std::int64_t timestamp) noexcept -> std::string;

/// @brief Deletes subvolume without escalating failures.
/// @param ops Filesystem operations.
/// @param subvolume_path Subvolume to delete.
/// @return true if the subvolume was deleted, the caller only logs false.
auto cleanup_subvolume(fs::SubvolumeOps& ops, std::string_view subvolume_path) noexcept -> bool;

/// @brief Runs snapshot, transfer, rename and cleanup for one subvolume.
/// @param ops Filesystem operations.
/// @param source Mounted source filesystem root.
/// @param destination Mounted destination filesystem root.
/// @param subvolume Subvolume name relative to source top level.
/// @return Outcome of the subvolume, produced exactly once.
auto migrate_subvolume(fs::SubvolumeOps& ops, std::string_view source, std::string_view destination, std::string_view subvolume) noexcept -> SubvolumeResult;

/// @brief Migrates subvolumes one at a time in the given order.
///
/// Failures are recorded and processing continues with the next subvolume.
auto migrate_subvolumes(fs::SubvolumeOps& ops, std::string_view source, std::string_view destination, const std::vector<std::string>& subvolumes) noexcept -> RunSummary;

/// @brief Enumerates source subvolumes and migrates them.
/// @return Summary of the run, or NoSubvolumesFound if the listing is empty.
auto run_migration(fs::SubvolumeOps& ops, std::string_view source, std::string_view destination) noexcept -> std::expected<RunSummary, MigrationError>;

}  // namespace btrmig::migration

#endif  // MIGRATION_HPP
