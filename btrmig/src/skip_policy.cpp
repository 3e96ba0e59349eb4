#include "btrmig/skip_policy.hpp"

#include <array>  // for array

using namespace std::string_view_literals;

namespace {

// exact-name rules are subsumed by the substring rules before them
constexpr std::array kSkipRules{
    btrmig::policy::SkipRule::ContainsSwap,
    btrmig::policy::SkipRule::SwapSubvolume,
    btrmig::policy::SkipRule::ContainsSnapshots,
    btrmig::policy::SkipRule::SnapshotsSubvolume,
    btrmig::policy::SkipRule::DotSnapshotsSubvolume,
};

}  // namespace

namespace btrmig::policy {

auto all_skip_rules() noexcept -> std::span<const SkipRule> {
    return kSkipRules;
}

auto matches_skip_rule(SkipRule rule, std::string_view subvolume) noexcept -> bool {
    switch (rule) {
    case SkipRule::ContainsSwap:
        return subvolume.contains("swap"sv);
    case SkipRule::SwapSubvolume:
        return subvolume == "@swap"sv;
    case SkipRule::ContainsSnapshots:
        return subvolume.contains("snapshots"sv);
    case SkipRule::SnapshotsSubvolume:
        return subvolume == "@snapshots"sv;
    case SkipRule::DotSnapshotsSubvolume:
        return subvolume == "@.snapshots"sv;
    }
    return false;
}

auto match_skip_rule(std::string_view subvolume) noexcept -> std::optional<SkipRule> {
    for (const auto rule : kSkipRules) {
        if (policy::matches_skip_rule(rule, subvolume)) {
            return rule;
        }
    }
    return std::nullopt;
}

auto skip_rule_to_string(SkipRule rule) noexcept -> std::string_view {
    switch (rule) {
    case SkipRule::ContainsSwap:
        return "contains 'swap'"sv;
    case SkipRule::SwapSubvolume:
        return "swap subvolume '@swap'"sv;
    case SkipRule::ContainsSnapshots:
        return "contains 'snapshots'"sv;
    case SkipRule::SnapshotsSubvolume:
        return "snapshot container '@snapshots'"sv;
    case SkipRule::DotSnapshotsSubvolume:
        return "snapshot container '@.snapshots'"sv;
    }
    return "unknown"sv;
}

}  // namespace btrmig::policy
