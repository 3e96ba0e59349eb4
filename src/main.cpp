#include "cli.hpp"              // for parse_cli_options, usage_text
#include "definitions.hpp"      // for error_inter, info_inter
#include "migrator_config.hpp"  // for MigrationConfig, merge_cli_options
#include "utils.hpp"            // for load_settings, preflight_checks
#include "widgets.hpp"          // for yesno_widget, summary_widget

// import btrmig
#include "btrmig/logger.hpp"
#include "btrmig/migration.hpp"
#include "btrmig/string_utils.hpp"
#include "btrmig/subvolume_ops.hpp"
#include "btrmig/summary.hpp"

#include <cstddef>  // for size_t
#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>  // for shutdown

int main(int argc, char* argv[]) {
    const auto& cli_options = migrator::parse_cli_options(argc, argv);
    if (!cli_options) {
        error_inter("{}\n\n", cli_options.error());
        output_inter("{}", migrator::usage_text());
        return btrmig::summary::kExitFatal;
    }
    if (cli_options->help) {
        output_inter("{}", migrator::usage_text());
        return btrmig::summary::kExitSuccess;
    }

    // Settings file first, command line on top.
    auto settings = migrator::get_default_config();
    if (cli_options->config_file) {
        auto loaded = utils::load_settings(*cli_options->config_file);
        if (!loaded) {
            error_inter("Failed to load settings: {}\n", loaded.error());
            return btrmig::summary::kExitFatal;
        }
        settings = std::move(*loaded);
    }
    const auto& config = migrator::merge_cli_options(std::move(settings), *cli_options);
    if (const auto& valid = migrator::validate_migration_config(config); !valid) {
        error_inter("{}\n\n", valid.error());
        output_inter("{}", migrator::usage_text());
        return btrmig::summary::kExitFatal;
    }

    // Initialize logger.
    auto logger = btrmig::logger::make_file_logger("btrmig_logger", config.log_file, config.verbose);
    if (!logger) {
        error_inter("Log file '{}' cannot be opened\n", config.log_file);
        return btrmig::summary::kExitFatal;
    }
    btrmig::logger::set_logger(logger);
    utils::dump_settings_to_log(config);

    const auto& source      = *config.source_mount;
    const auto& destination = *config.dest_mount;

    if (config.dry_run) {
        info_inter("Running in dry-run mode, no changes will be made\n");
        spdlog::info("Running in DRY RUN mode!");
    } else {
        if (!utils::preflight_checks(config)) {
            error_inter("Preflight checks failed, see '{}' for details\n", config.log_file);
            spdlog::shutdown();
            return btrmig::summary::kExitFatal;
        }
        if (!config.assume_yes) {
            const auto& content = fmt::format(FMT_COMPILE("\nAll subvolumes of '{}'\nwill be copied into '{}'.\n\nProceed with migration?\n"), source, destination);
            if (!tui::detail::yesno_widget(content)) {
                warning_inter("Migration cancelled\n");
                spdlog::info("Migration cancelled by user");
                spdlog::shutdown();
                return btrmig::summary::kExitFatal;
            }
        }
    }

    info_inter("Migrating subvolumes from '{}' to '{}'\n", source, destination);
    btrmig::fs::BtrfsSubvolumeOps ops{config.dry_run};
    const auto& result = btrmig::migration::run_migration(ops, source, destination);
    if (!result) {
        error_inter("Migration aborted: {} in '{}'\n", btrmig::migration::migration_error_to_string(result.error()), source);
        spdlog::shutdown();
        return btrmig::summary::kExitFatal;
    }

    const auto& summary = *result;
    const auto& report  = btrmig::summary::format_summary(summary);
    spdlog::info("Summary:\n{}", report);

    auto lines         = btrmig::utils::make_multiline(report);
    const auto header  = lines.front();
    lines.erase(lines.begin());
    tui::detail::summary_widget(header, lines);
    output_inter("\n");

    if (summary.succeeded()) {
        success_inter("Migration completed successfully\n");
        output_inter("\nNext steps:\n");
        const auto& steps = btrmig::summary::next_steps(destination);
        for (std::size_t i = 0; i < steps.size(); ++i) {
            output_inter("  {}. {}\n", i + 1, steps[i]);
        }
    } else {
        warning_inter("{} subvolume(s) failed to migrate, see '{}' for details\n", summary.failed, config.log_file);
    }

    spdlog::shutdown();
    return btrmig::summary::summary_exit_code(summary);
}
