#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "btrmig/logger.hpp"
#include "btrmig/migration.hpp"
#include "btrmig/subvolume_ops.hpp"
#include "btrmig/summary.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

using btrmig::migration::FailureKind;
using btrmig::migration::MigrationError;
using btrmig::migration::MigrationStatus;
using btrmig::migration::RunSummary;

constexpr std::int64_t kTimestamp = 1700000000;

// In-memory source and destination trees, every path is a full path.
class FakeSubvolumeOps final : public btrmig::fs::SubvolumeOps {
 public:
    explicit FakeSubvolumeOps(std::vector<std::string> subvolumes) : listing(std::move(subvolumes)) {
        for (const auto& name : listing) {
            paths.insert("/src/"s + name);
        }
    }

    std::vector<std::string> listing{};
    std::set<std::string> paths{};
    std::int64_t timestamp{kTimestamp};

    std::set<std::string> failing_snapshots{};
    std::set<std::string> failing_transfers{};
    std::set<std::string> dropped_transfers{};
    std::set<std::string> failing_deletes{};
    std::set<std::string> failing_renames{};
    bool failing_make_writable{false};

    std::size_t list_calls{};
    std::size_t mutating_calls{};
    std::map<std::string, std::size_t> delete_calls{};

    auto list_subvolumes(std::string_view) noexcept -> std::vector<std::string> override {
        ++list_calls;
        return listing;
    }

    auto is_directory(std::string_view path) noexcept -> bool override {
        return paths.contains(std::string{path});
    }

    auto create_snapshot(std::string_view subvolume_path, std::string_view snapshot_path) noexcept -> bool override {
        ++mutating_calls;
        if (failing_snapshots.contains(std::string{subvolume_path})) {
            return false;
        }
        return paths.emplace(snapshot_path).second;
    }

    auto send_receive(std::string_view snapshot_path, std::string_view destination) noexcept -> bool override {
        ++mutating_calls;
        const std::string snapshot{snapshot_path};
        if (failing_transfers.contains(snapshot)) {
            return false;
        }
        if (dropped_transfers.contains(snapshot)) {
            return true;
        }
        const auto& name = snapshot.substr(snapshot.find_last_of('/') + 1);
        return paths.emplace(std::string{destination} + "/" + name).second;
    }

    auto rename_subvolume(std::string_view from, std::string_view to) noexcept -> bool override {
        ++mutating_calls;
        const std::string target{to};
        if (failing_renames.contains(target) || paths.contains(target) || !paths.contains(std::string{from})) {
            return false;
        }
        paths.erase(std::string{from});
        paths.insert(target);

        // a received parent carries empty directories where nested subvolumes were
        const auto root_end = target.find('/', 1) + 1;
        const auto& parent  = target.substr(root_end) + "/";
        for (const auto& name : listing) {
            if (name.starts_with(parent)) {
                paths.insert(target.substr(0, root_end) + name);
            }
        }
        return true;
    }

    auto make_writable(std::string_view) noexcept -> bool override {
        ++mutating_calls;
        return !failing_make_writable;
    }

    auto delete_subvolume(std::string_view subvolume_path) noexcept -> bool override {
        ++mutating_calls;
        const std::string path{subvolume_path};
        ++delete_calls[path];
        if (failing_deletes.contains(path)) {
            return false;
        }
        return paths.erase(path) == 1;
    }

    auto unix_timestamp() noexcept -> std::int64_t override {
        return timestamp;
    }

    [[nodiscard]] auto has_path_with_prefix(std::string_view prefix) const -> bool {
        return std::ranges::any_of(paths, [prefix](const std::string& path) { return path.starts_with(prefix); });
    }
};

auto snapshot_path(std::string_view subvolume, std::int64_t timestamp = kTimestamp) -> std::string {
    return "/src/"s + btrmig::migration::make_snapshot_name(subvolume, timestamp);
}

auto received_path(std::string_view subvolume, std::int64_t timestamp = kTimestamp) -> std::string {
    return "/dst/"s + btrmig::migration::make_snapshot_name(subvolume, timestamp);
}

void check_counts(const RunSummary& summary) {
    REQUIRE_EQ(summary.total, summary.migrated + summary.failed + summary.skipped);
    REQUIRE_EQ(summary.total, summary.results.size());
}

auto find_result(const RunSummary& summary, std::string_view subvolume) -> const btrmig::migration::SubvolumeResult& {
    const auto it = std::ranges::find(summary.results, subvolume, &btrmig::migration::SubvolumeResult::subvolume);
    REQUIRE(it != summary.results.end());
    return *it;
}

}  // namespace

TEST_CASE("migration loop test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    btrmig::logger::set_logger(logger);

    const std::vector<std::string> listing{"@"s, "@home"s, "@swap"s, "@snapshots"s, "@var"s};

    SECTION("all subvolumes transfer")
    {
        FakeSubvolumeOps ops{listing};
        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        REQUIRE_EQ(summary.total, 5);
        REQUIRE_EQ(summary.migrated, 3);
        REQUIRE_EQ(summary.skipped, 2);
        REQUIRE_EQ(summary.failed, 0);
        REQUIRE(summary.succeeded());
        REQUIRE_EQ(btrmig::summary::summary_exit_code(summary), btrmig::summary::kExitSuccess);

        // enumeration order is kept
        REQUIRE_EQ(summary.results[0].subvolume, "@"sv);
        REQUIRE_EQ(summary.results[1].subvolume, "@home"sv);
        REQUIRE_EQ(summary.results[2].subvolume, "@swap"sv);
        REQUIRE_EQ(summary.results[3].subvolume, "@snapshots"sv);
        REQUIRE_EQ(summary.results[4].subvolume, "@var"sv);
        REQUIRE_EQ(summary.results[2].status, MigrationStatus::Skipped);
        REQUIRE_EQ(summary.results[3].status, MigrationStatus::Skipped);

        REQUIRE(ops.paths.contains("/dst/@"s));
        REQUIRE(ops.paths.contains("/dst/@home"s));
        REQUIRE(ops.paths.contains("/dst/@var"s));
        REQUIRE(!ops.paths.contains("/dst/@swap"s));
        REQUIRE(!ops.paths.contains("/dst/@snapshots"s));
        REQUIRE(!ops.has_path_with_prefix(snapshot_path("@")));
        REQUIRE(!ops.has_path_with_prefix("/src/@home_snapshot_"sv));
        REQUIRE(!ops.has_path_with_prefix("/dst/@home_snapshot_"sv));

        for (const auto& result : summary.results) {
            REQUIRE(!result.failure.has_value());
            REQUIRE(result.warnings.empty());
        }
    }
    SECTION("snapshot failure does not stop the run")
    {
        FakeSubvolumeOps ops{listing};
        ops.failing_snapshots.insert("/src/@home"s);

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        REQUIRE_EQ(summary.migrated, 2);
        REQUIRE_EQ(summary.failed, 1);
        REQUIRE_EQ(summary.skipped, 2);
        REQUIRE(!summary.succeeded());
        REQUIRE_EQ(btrmig::summary::summary_exit_code(summary), btrmig::summary::kExitMigrationFailed);

        const auto& home = find_result(summary, "@home"sv);
        REQUIRE_EQ(home.status, MigrationStatus::Failed);
        REQUIRE_EQ(home.failure, FailureKind::SnapshotCreationFailed);
        REQUIRE_EQ(home.reason(), "snapshot creation failed"sv);

        REQUIRE(!ops.has_path_with_prefix("/src/@home_snapshot_"sv));
        REQUIRE(!ops.delete_calls.contains(snapshot_path("@home")));
        REQUIRE(!ops.paths.contains("/dst/@home"s));

        // subvolume after the failed one still completes
        REQUIRE_EQ(find_result(summary, "@var"sv).status, MigrationStatus::Migrated);
        REQUIRE(ops.paths.contains("/dst/@var"s));
    }
    SECTION("missing received subvolume cleans snapshot once")
    {
        FakeSubvolumeOps ops{listing};
        ops.dropped_transfers.insert(snapshot_path("@home"));

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        const auto& home = find_result(summary, "@home"sv);
        REQUIRE_EQ(home.status, MigrationStatus::Failed);
        REQUIRE_EQ(home.failure, FailureKind::ReceivedSubvolumeMissing);
        REQUIRE_EQ(ops.delete_calls[snapshot_path("@home")], 1);
        REQUIRE(!ops.paths.contains(snapshot_path("@home")));
        REQUIRE_EQ(summary.failed, 1);
        REQUIRE_EQ(summary.migrated, 2);
    }
    SECTION("transfer failure cleans snapshot")
    {
        FakeSubvolumeOps ops{listing};
        ops.failing_transfers.insert(snapshot_path("@"));

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        const auto& root = find_result(summary, "@"sv);
        REQUIRE_EQ(root.status, MigrationStatus::Failed);
        REQUIRE_EQ(root.failure, FailureKind::TransferFailed);
        REQUIRE_EQ(ops.delete_calls[snapshot_path("@")], 1);
        REQUIRE(!ops.paths.contains(snapshot_path("@")));
        REQUIRE(!ops.paths.contains("/dst/@"s));
        REQUIRE_EQ(summary.migrated, 2);
    }
    SECTION("transfer failure with failing cleanup is still one failure")
    {
        FakeSubvolumeOps ops{listing};
        ops.failing_transfers.insert(snapshot_path("@"));
        ops.failing_deletes.insert(snapshot_path("@"));

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        REQUIRE_EQ(find_result(summary, "@"sv).failure, FailureKind::TransferFailed);
        REQUIRE_EQ(summary.failed, 1);
        REQUIRE_EQ(summary.migrated, 2);
    }
    SECTION("rename failure cleans both sides")
    {
        FakeSubvolumeOps ops{listing};
        ops.failing_renames.insert("/dst/@var"s);

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        const auto& var = find_result(summary, "@var"sv);
        REQUIRE_EQ(var.status, MigrationStatus::Failed);
        REQUIRE_EQ(var.failure, FailureKind::RenameFailed);
        REQUIRE_EQ(ops.delete_calls[received_path("@var")], 1);
        REQUIRE_EQ(ops.delete_calls[snapshot_path("@var")], 1);
        REQUIRE(!ops.paths.contains(received_path("@var")));
        REQUIRE(!ops.paths.contains(snapshot_path("@var")));
        REQUIRE(!ops.paths.contains("/dst/@var"s));
    }
    SECTION("cleanup failure after transfer keeps subvolume migrated")
    {
        FakeSubvolumeOps ops{listing};
        ops.failing_deletes.insert(snapshot_path("@home"));

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        const auto& home = find_result(summary, "@home"sv);
        REQUIRE_EQ(home.status, MigrationStatus::Migrated);
        REQUIRE(!home.failure.has_value());
        REQUIRE_EQ(home.warnings.size(), 1);
        REQUIRE(home.warnings[0].contains("stray snapshot"sv));
        REQUIRE(ops.paths.contains(snapshot_path("@home")));
        REQUIRE(ops.paths.contains("/dst/@home"s));
        REQUIRE(summary.succeeded());
    }
    SECTION("read-only flag failure is a warning")
    {
        FakeSubvolumeOps ops{listing};
        ops.failing_make_writable = true;

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
        check_counts(summary);

        REQUIRE_EQ(summary.migrated, 3);
        REQUIRE(summary.succeeded());
        REQUIRE(find_result(summary, "@"sv).warnings[0].contains("read-only"sv));
    }
    SECTION("missing source path")
    {
        FakeSubvolumeOps ops{listing};
        ops.paths.erase("/src/@home"s);

        const auto result = btrmig::migration::migrate_subvolume(ops, "/src"sv, "/dst"sv, "@home"sv);
        REQUIRE_EQ(result.status, MigrationStatus::Failed);
        REQUIRE_EQ(result.failure, FailureKind::SourcePathMissing);
        REQUIRE_EQ(result.reason(), "source path missing"sv);
        REQUIRE_EQ(ops.mutating_calls, 0);
    }
    SECTION("skipped subvolume is never touched")
    {
        FakeSubvolumeOps ops{listing};

        const auto result = btrmig::migration::migrate_subvolume(ops, "/src"sv, "/dst"sv, "@swap"sv);
        REQUIRE_EQ(result.status, MigrationStatus::Skipped);
        REQUIRE(result.skip_rule.has_value());
        REQUIRE(!result.failure.has_value());
        REQUIRE_EQ(ops.mutating_calls, 0);
    }
    SECTION("nested subvolume collides with placeholder in migrated parent")
    {
        const std::vector<std::string> nested{"@"s, "@/var/lib/machines"s};
        FakeSubvolumeOps ops{nested};

        const auto summary = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, nested);
        check_counts(summary);

        REQUIRE_EQ(summary.migrated, 1);
        REQUIRE_EQ(summary.failed, 1);
        const auto& result = find_result(summary, "@/var/lib/machines"sv);
        REQUIRE_EQ(result.status, MigrationStatus::Failed);
        REQUIRE_EQ(result.failure, FailureKind::RenameFailed);

        // placeholder stays, received copy and snapshot are removed
        REQUIRE(ops.paths.contains("/dst/@/var/lib/machines"s));
        REQUIRE(!ops.paths.contains("/dst/"s + btrmig::migration::make_snapshot_name("machines"sv, kTimestamp)));
        REQUIRE(!ops.paths.contains(snapshot_path("@/var/lib/machines")));
    }
}

TEST_CASE("migration rerun test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    btrmig::logger::set_logger(logger);

    const std::vector<std::string> listing{"@"s, "@home"s, "@swap"s, "@snapshots"s, "@var"s};
    FakeSubvolumeOps ops{listing};

    const auto first = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
    check_counts(first);
    REQUIRE_EQ(first.migrated, 3);

    ops.timestamp = kTimestamp + 60;
    const auto second = btrmig::migration::migrate_subvolumes(ops, "/src"sv, "/dst"sv, listing);
    check_counts(second);

    REQUIRE_EQ(second.migrated, 0);
    REQUIRE_EQ(second.failed, 3);
    REQUIRE_EQ(second.skipped, 2);
    REQUIRE(!second.succeeded());
    for (const auto& name : {"@"sv, "@home"sv, "@var"sv}) {
        REQUIRE_EQ(find_result(second, name).failure, FailureKind::RenameFailed);
    }

    // first run's subvolumes survive, second run leaves nothing behind
    REQUIRE(ops.paths.contains("/dst/@"s));
    REQUIRE(ops.paths.contains("/dst/@home"s));
    REQUIRE(ops.paths.contains("/dst/@var"s));
    REQUIRE(!ops.has_path_with_prefix("/dst/@home_snapshot_"sv));
    REQUIRE(!ops.has_path_with_prefix("/src/@home_snapshot_"sv));
}

TEST_CASE("run migration test")
{
    auto logger = std::make_shared<spdlog::logger>("default", std::make_shared<spdlog::sinks::null_sink_mt>());
    btrmig::logger::set_logger(logger);

    SECTION("empty listing aborts before any mutation")
    {
        FakeSubvolumeOps ops{std::vector<std::string>{}};

        const auto result = btrmig::migration::run_migration(ops, "/src"sv, "/dst"sv);
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error(), MigrationError::NoSubvolumesFound);
        REQUIRE_EQ(ops.list_calls, 1);
        REQUIRE_EQ(ops.mutating_calls, 0);
        REQUIRE(ops.delete_calls.empty());
    }
    SECTION("listing is migrated")
    {
        FakeSubvolumeOps ops{{"@"s, "@home"s, "@.snapshots"s}};

        const auto result = btrmig::migration::run_migration(ops, "/src"sv, "/dst"sv);
        REQUIRE(result.has_value());

        const auto& summary = *result;
        check_counts(summary);
        REQUIRE_EQ(summary.migrated, 2);
        REQUIRE_EQ(summary.skipped, 1);
        REQUIRE(summary.succeeded());
    }
    SECTION("dry run touches nothing")
    {
        btrmig::fs::BtrfsSubvolumeOps ops{true};
        REQUIRE(ops.is_dry_run());

        const auto result = btrmig::migration::run_migration(ops, "/nonexistent/src"sv, "/nonexistent/dst"sv);
        REQUIRE(result.has_value());

        const auto& summary = *result;
        check_counts(summary);
        REQUIRE_EQ(summary.total, btrmig::fs::dry_run_subvolumes().size());
        REQUIRE_EQ(summary.migrated, 4);
        REQUIRE_EQ(summary.skipped, 1);
        REQUIRE_EQ(find_result(summary, "@snapshots"sv).status, MigrationStatus::Skipped);
    }
}
