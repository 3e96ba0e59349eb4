#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace btrmig::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

// Runs args directly (no shell) and waits for it.
// Returns true if the child exited with status 0.
auto exec(const std::vector<std::string>& vec) noexcept -> bool;

// Runs args directly (no shell) and returns its stdout without the final newline.
// Empty if the command cannot be spawned.
auto exec_capture(const std::vector<std::string>& vec) noexcept -> std::string;

/// @brief Runs `lhs | rhs` without a shell.
/// @param lhs Producer argument vector.
/// @param rhs Consumer argument vector.
/// @return true only if both sides exited with status 0.
auto exec_pipeline(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs) noexcept -> bool;

}  // namespace btrmig::utils

#endif  // IO_UTILS_HPP
