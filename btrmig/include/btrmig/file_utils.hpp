#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace btrmig::file_utils {

// Empty on read failure
auto read_whole_file(std::string_view filepath) noexcept -> std::string;

auto file_exists(std::string_view filepath) noexcept -> bool;

}  // namespace btrmig::file_utils

#endif  // FILE_UTILS_HPP
