#include "btrmig/file_utils.hpp"

#include <cerrno>       // for errno
#include <cstdio>       // for fopen, fclose, fread, fseek, ftell
#include <cstring>      // for strerror
#include <filesystem>   // for exists, is_regular_file
#include <string>       // for string
#include <string_view>  // for string_view

#include <spdlog/spdlog.h>

namespace btrmig::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::string {
    const std::string path{filepath};
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    std::fseek(file, 0u, SEEK_END);
    const auto size = static_cast<std::size_t>(std::ftell(file));
    std::fseek(file, 0u, SEEK_SET);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file);
    std::fclose(file);
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return {};
    }

    return buf;
}

auto file_exists(std::string_view filepath) noexcept -> bool {
    std::error_code err{};
    return std::filesystem::is_regular_file(filepath, err);
}

}  // namespace btrmig::file_utils
