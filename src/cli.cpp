#include "cli.hpp"

#include <getopt.h>  // for getopt_long, option

#include <fmt/compile.h>
#include <fmt/format.h>

namespace migrator {

auto usage_text() noexcept -> std::string {
    return fmt::format(FMT_COMPILE(R"(Usage: btrmig [OPTIONS] SOURCE_MOUNT DEST_MOUNT

Migrate btrfs subvolumes from a mounted source filesystem to a mounted destination.

Options:
  -c, --config FILE   JSON settings file
  -n, --dry-run       log commands instead of running them
  -y, --yes           do not ask for confirmation
  -l, --log FILE      log file (default {})
  -v, --verbose       debug level logging
  -h, --help          show this help
)"),
        kDefaultLogFile);
}

auto parse_cli_options(int argc, char* const argv[]) noexcept -> std::expected<CliOptions, std::string> {
    static constexpr struct option long_options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"dry-run", no_argument, nullptr, 'n'},
        {"yes", no_argument, nullptr, 'y'},
        {"log", required_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    CliOptions opts{};

    // reinitialize getopt state, parse may run more than once per process
    optind = 0;
    opterr = 0;

    int opt{};
    while ((opt = getopt_long(argc, argv, ":c:nyl:vh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'n':
            opts.dry_run = true;
            break;
        case 'y':
            opts.assume_yes = true;
            break;
        case 'l':
            opts.log_file = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            opts.help = true;
            return opts;
        case ':':
            return std::unexpected(fmt::format(FMT_COMPILE("option '{}' requires an argument"), argv[optind - 1]));
        default:
            if (optopt != 0) {
                return std::unexpected(fmt::format(FMT_COMPILE("unknown option '-{}'"), static_cast<char>(optopt)));
            }
            return std::unexpected(fmt::format(FMT_COMPILE("unknown option '{}'"), argv[optind - 1]));
        }
    }

    const auto positional = argc - optind;
    if (positional != 0 && positional != 2) {
        return std::unexpected(fmt::format(FMT_COMPILE("expected SOURCE_MOUNT and DEST_MOUNT, got {} arguments"), positional));
    }
    if (positional == 2) {
        opts.source_mount = argv[optind];
        opts.dest_mount   = argv[optind + 1];
    }

    return opts;
}

}  // namespace migrator
