#include "doctest_compatibility.h"

#include "cli.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

auto parse(std::vector<std::string> args) {
    args.insert(args.begin(), "btrmig"s);

    std::vector<char*> argv{};
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return migrator::parse_cli_options(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST_CASE("command line parsing")
{
    SECTION("positional mounts")
    {
        const auto& result = parse({"/mnt/migration_source"s, "/mnt/migration_target"s});
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->source_mount, "/mnt/migration_source"sv);
        REQUIRE_EQ(result->dest_mount, "/mnt/migration_target"sv);
        REQUIRE(!result->dry_run);
        REQUIRE(!result->assume_yes);
        REQUIRE(!result->config_file.has_value());
    }
    SECTION("short options")
    {
        const auto& result = parse({"-n"s, "-y"s, "-v"s, "-c"s, "/etc/btrmig.json"s, "-l"s, "/tmp/run.log"s, "/mnt/a"s, "/mnt/b"s});
        REQUIRE(result.has_value());
        REQUIRE(result->dry_run);
        REQUIRE(result->assume_yes);
        REQUIRE(result->verbose);
        REQUIRE_EQ(result->config_file, "/etc/btrmig.json"sv);
        REQUIRE_EQ(result->log_file, "/tmp/run.log"sv);
        REQUIRE_EQ(result->source_mount, "/mnt/a"sv);
        REQUIRE_EQ(result->dest_mount, "/mnt/b"sv);
    }
    SECTION("long options")
    {
        const auto& result = parse({"--dry-run"s, "--yes"s, "--config=/etc/btrmig.json"s, "--log"s, "/tmp/run.log"s});
        REQUIRE(result.has_value());
        REQUIRE(result->dry_run);
        REQUIRE(result->assume_yes);
        REQUIRE_EQ(result->config_file, "/etc/btrmig.json"sv);
        REQUIRE_EQ(result->log_file, "/tmp/run.log"sv);
        REQUIRE(!result->source_mount.has_value());
    }
    SECTION("help")
    {
        const auto& result = parse({"--help"s});
        REQUIRE(result.has_value());
        REQUIRE(result->help);
        REQUIRE(migrator::usage_text().starts_with("Usage: btrmig"));
    }
    SECTION("single positional argument")
    {
        const auto& result = parse({"/mnt/a"s});
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error(), "expected SOURCE_MOUNT and DEST_MOUNT, got 1 arguments"s);
    }
    SECTION("unknown option")
    {
        const auto& result = parse({"-x"s, "/mnt/a"s, "/mnt/b"s});
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error(), "unknown option '-x'"s);
    }
    SECTION("missing option argument")
    {
        const auto& result = parse({"/mnt/a"s, "/mnt/b"s, "--config"s});
        REQUIRE(!result.has_value());
    }
}
