#ifndef CLI_HPP
#define CLI_HPP

#include "migrator_config.hpp"

#include <expected>  // for expected
#include <string>    // for string

namespace migrator {

/// Parses "btrmig [OPTIONS] SOURCE_MOUNT DEST_MOUNT".
/// @return Parsed options, or error string on unknown option or wrong argument count.
[[nodiscard]] auto parse_cli_options(int argc, char* const argv[]) noexcept -> std::expected<CliOptions, std::string>;

[[nodiscard]] auto usage_text() noexcept -> std::string;

}  // namespace migrator

#endif  // CLI_HPP
