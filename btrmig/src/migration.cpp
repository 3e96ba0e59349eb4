#include "btrmig/migration.hpp"

#include <expected>  // for expected, unexpected
#include <utility>   // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using btrmig::migration::FailureKind;
using btrmig::migration::MigrationStatus;
using btrmig::migration::SubvolumeResult;

auto make_failed(std::string_view subvolume, FailureKind kind) noexcept -> SubvolumeResult {
    spdlog::error("Subvolume '{}' failed: {}", subvolume, btrmig::migration::failure_kind_to_string(kind));
    return SubvolumeResult{.subvolume = std::string{subvolume}, .status = MigrationStatus::Failed, .failure = kind};
}

// receive creates the subvolume under the last path component of the snapshot
constexpr auto get_basename(std::string_view path) noexcept -> std::string_view {
    const auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

}  // namespace

namespace btrmig::migration {

auto SubvolumeResult::reason() const noexcept -> std::string_view {
    if (failure) {
        return failure_kind_to_string(*failure);
    }
    if (skip_rule) {
        return policy::skip_rule_to_string(*skip_rule);
    }
    return {};
}

auto status_to_string(MigrationStatus status) noexcept -> std::string_view {
    switch (status) {
    case MigrationStatus::Migrated:
        return "migrated"sv;
    case MigrationStatus::Failed:
        return "failed"sv;
    case MigrationStatus::Skipped:
        return "skipped"sv;
    }
    return "unknown"sv;
}

auto failure_kind_to_string(FailureKind kind) noexcept -> std::string_view {
    switch (kind) {
    case FailureKind::SourcePathMissing:
        return "source path missing"sv;
    case FailureKind::SnapshotCreationFailed:
        return "snapshot creation failed"sv;
    case FailureKind::TransferFailed:
        return "transfer failed"sv;
    case FailureKind::ReceivedSubvolumeMissing:
        return "received subvolume missing"sv;
    case FailureKind::RenameFailed:
        return "rename failed"sv;
    }
    return "unknown"sv;
}

auto migration_error_to_string(MigrationError error) noexcept -> std::string_view {
    switch (error) {
    case MigrationError::NoSubvolumesFound:
        return "no subvolumes found"sv;
    }
    return "unknown"sv;
}

auto make_snapshot_name(std::string_view subvolume, std::int64_t timestamp) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}_snapshot_{}"), subvolume, timestamp);
}

auto cleanup_subvolume(fs::SubvolumeOps& ops, std::string_view subvolume_path) noexcept -> bool {
    if (!ops.delete_subvolume(subvolume_path)) {
        return false;
    }
    spdlog::debug("Deleted '{}'", subvolume_path);
    return true;
}

auto migrate_subvolume(fs::SubvolumeOps& ops, std::string_view source, std::string_view destination, std::string_view subvolume) noexcept -> SubvolumeResult {
    // 1. Skip check
    if (const auto& rule = policy::match_skip_rule(subvolume)) {
        spdlog::info("Skipping subvolume '{}' ({})", subvolume, policy::skip_rule_to_string(*rule));
        return SubvolumeResult{.subvolume = std::string{subvolume}, .status = MigrationStatus::Skipped, .skip_rule = *rule};
    }

    // 2. Source must exist
    const auto& subvolume_path = fmt::format(FMT_COMPILE("{}/{}"), source, subvolume);
    if (!ops.is_directory(subvolume_path)) {
        return make_failed(subvolume, FailureKind::SourcePathMissing);
    }

    // 3. Read-only snapshot, timestamp taken right before creating it
    const auto& snapshot_name = migration::make_snapshot_name(subvolume, ops.unix_timestamp());
    const auto& snapshot_path = fmt::format(FMT_COMPILE("{}/{}"), source, snapshot_name);
    spdlog::info("Creating snapshot '{}'", snapshot_path);
    if (!ops.create_snapshot(subvolume_path, snapshot_path)) {
        return make_failed(subvolume, FailureKind::SnapshotCreationFailed);
    }

    // 4. Transfer
    spdlog::info("Transferring '{}' to '{}'", snapshot_path, destination);
    if (!ops.send_receive(snapshot_path, destination)) {
        if (!migration::cleanup_subvolume(ops, snapshot_path)) {
            spdlog::warn("Failed to delete snapshot '{}' after failed transfer", snapshot_path);
        }
        return make_failed(subvolume, FailureKind::TransferFailed);
    }

    // 5. Finalize name
    const auto& received_path = fmt::format(FMT_COMPILE("{}/{}"), destination, get_basename(snapshot_name));
    const auto& target_path   = fmt::format(FMT_COMPILE("{}/{}"), destination, subvolume);
    if (!ops.is_directory(received_path)) {
        if (!migration::cleanup_subvolume(ops, snapshot_path)) {
            spdlog::warn("Failed to delete snapshot '{}'", snapshot_path);
        }
        return make_failed(subvolume, FailureKind::ReceivedSubvolumeMissing);
    }
    if (!ops.rename_subvolume(received_path, target_path)) {
        if (!migration::cleanup_subvolume(ops, received_path)) {
            spdlog::warn("Failed to delete received subvolume '{}'", received_path);
        }
        if (!migration::cleanup_subvolume(ops, snapshot_path)) {
            spdlog::warn("Failed to delete snapshot '{}'", snapshot_path);
        }
        return make_failed(subvolume, FailureKind::RenameFailed);
    }

    SubvolumeResult result{.subvolume = std::string{subvolume}, .status = MigrationStatus::Migrated};

    // received subvolumes are read-only
    if (!ops.make_writable(target_path)) {
        spdlog::warn("Subvolume '{}' is still read-only", target_path);
        result.warnings.emplace_back(fmt::format(FMT_COMPILE("'{}' is still read-only"), target_path));
    }

    // 6. Cleanup never rolls back a completed migration
    if (!migration::cleanup_subvolume(ops, snapshot_path)) {
        spdlog::warn("Failed to delete snapshot '{}', remove it manually", snapshot_path);
        result.warnings.emplace_back(fmt::format(FMT_COMPILE("stray snapshot left at '{}'"), snapshot_path));
    }

    // 7. Done
    spdlog::info("Migrated subvolume '{}'", subvolume);
    return result;
}

auto migrate_subvolumes(fs::SubvolumeOps& ops, std::string_view source, std::string_view destination, const std::vector<std::string>& subvolumes) noexcept -> RunSummary {
    RunSummary summary{};
    summary.results.reserve(subvolumes.size());

    for (const auto& subvolume : subvolumes) {
        auto result = migration::migrate_subvolume(ops, source, destination, subvolume);
        switch (result.status) {
        case MigrationStatus::Migrated:
            ++summary.migrated;
            break;
        case MigrationStatus::Failed:
            ++summary.failed;
            break;
        case MigrationStatus::Skipped:
            ++summary.skipped;
            break;
        }
        ++summary.total;
        summary.results.push_back(std::move(result));
    }

    spdlog::info("Migration finished: total={} migrated={} failed={} skipped={}", summary.total, summary.migrated, summary.failed, summary.skipped);
    return summary;
}

auto run_migration(fs::SubvolumeOps& ops, std::string_view source, std::string_view destination) noexcept -> std::expected<RunSummary, MigrationError> {
    const auto& subvolumes = ops.list_subvolumes(source);
    if (subvolumes.empty()) {
        spdlog::error("No subvolumes found in '{}'", source);
        return std::unexpected(MigrationError::NoSubvolumesFound);
    }

    spdlog::info("Found {} subvolumes total", subvolumes.size());
    return migration::migrate_subvolumes(ops, source, destination, subvolumes);
}

}  // namespace btrmig::migration
