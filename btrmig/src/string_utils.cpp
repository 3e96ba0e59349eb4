#include "btrmig/string_utils.hpp"

#include <algorithm>  // for for_each, reverse

namespace btrmig::utils {

auto make_multiline(std::string_view str, bool reverse, char delim) noexcept -> std::vector<std::string> {
    std::vector<std::string> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    if (reverse) {
        std::ranges::reverse(lines);
    }
    return lines;
}

}  // namespace btrmig::utils
