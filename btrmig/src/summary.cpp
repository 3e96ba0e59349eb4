#include "btrmig/summary.hpp"

#include <iterator>  // for back_inserter

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace btrmig::summary {

auto summary_exit_code(const migration::RunSummary& summary) noexcept -> std::int32_t {
    return summary.succeeded() ? kExitSuccess : kExitMigrationFailed;
}

auto format_result_line(const migration::SubvolumeResult& result) noexcept -> std::string {
    const auto& status = migration::status_to_string(result.status);
    const auto& reason = result.reason();

    auto line = reason.empty()
        ? fmt::format(FMT_COMPILE("{}: {}"), result.subvolume, status)
        : fmt::format(FMT_COMPILE("{}: {} ({})"), result.subvolume, status, reason);
    if (!result.warnings.empty()) {
        fmt::format_to(std::back_inserter(line), " [warning: {}]", fmt::join(result.warnings, "; "));
    }
    return line;
}

auto format_summary(const migration::RunSummary& summary) noexcept -> std::string {
    std::string report = fmt::format(FMT_COMPILE("Total: {}, migrated: {}, failed: {}, skipped: {}\n"),
        summary.total, summary.migrated, summary.failed, summary.skipped);
    for (const auto& result : summary.results) {
        report += summary::format_result_line(result);
        report += '\n';
    }
    return report;
}

auto next_steps(std::string_view destination) noexcept -> std::vector<std::string> {
    return {
        "Verify the migration by checking the migrated subvolumes",
        "Test boot from the new drive",
        "Update any remaining configuration files (fstab, crypttab, bootloader)",
        "Consider creating a backup of the old drive before removing it",
        fmt::format(FMT_COMPILE("List subvolumes: btrfs subvolume list {}"), destination),
        "Check filesystem: btrfs filesystem show",
    };
}

}  // namespace btrmig::summary
