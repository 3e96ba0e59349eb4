#ifndef SKIP_POLICY_HPP
#define SKIP_POLICY_HPP

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <span>         // for span
#include <string_view>  // for string_view

namespace btrmig::policy {

/// Rules excluding a subvolume from migration.
/// Matching is case-sensitive.
enum class SkipRule : std::uint8_t {
    /// name contains "swap"
    ContainsSwap,
    /// name is exactly "@swap"
    SwapSubvolume,
    /// name contains "snapshots"
    ContainsSnapshots,
    /// name is exactly "@snapshots"
    SnapshotsSubvolume,
    /// name is exactly "@.snapshots"
    DotSnapshotsSubvolume,
};

/// @brief All rules in evaluation order.
auto all_skip_rules() noexcept -> std::span<const SkipRule>;

/// @brief Checks a single rule against subvolume name.
auto matches_skip_rule(SkipRule rule, std::string_view subvolume) noexcept -> bool;

/// @brief Finds the first rule excluding the subvolume.
/// @param subvolume Subvolume name relative to the filesystem top level.
/// @return The matched rule, or std::nullopt if the subvolume should be migrated.
auto match_skip_rule(std::string_view subvolume) noexcept -> std::optional<SkipRule>;

/// @brief Whether subvolume is excluded from migration.
inline auto should_skip(std::string_view subvolume) noexcept -> bool {
    return match_skip_rule(subvolume).has_value();
}

/// @brief Human readable rule description.
auto skip_rule_to_string(SkipRule rule) noexcept -> std::string_view;

}  // namespace btrmig::policy

#endif  // SKIP_POLICY_HPP
