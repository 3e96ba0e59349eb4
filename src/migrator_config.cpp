#include "migrator_config.hpp"

#include <expected>     // for expected, unexpected
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

auto parse_bool_field(const rapidjson::Document& doc, const char* name, bool& value) noexcept -> std::expected<void, std::string> {
    if (!doc.HasMember(name)) {
        return {};
    }
    if (!doc[name].IsBool()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a boolean"), name));
    }
    value = doc[name].GetBool();
    return {};
}

auto parse_string_field(const rapidjson::Document& doc, const char* name) noexcept -> std::expected<std::optional<std::string>, std::string> {
    if (!doc.HasMember(name)) {
        return std::nullopt;
    }
    if (!doc[name].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), name));
    }
    return std::string{doc[name].GetString(), doc[name].GetStringLength()};
}

}  // namespace

namespace migrator {

auto get_default_config() noexcept -> MigrationConfig {
    return MigrationConfig{
        .dry_run    = false,
        .assume_yes = false,
        .log_file   = std::string{kDefaultLogFile},
        .verbose    = false,
    };
}

auto normalize_mount_path(std::string_view path) noexcept -> std::string {
    while (path.size() > 1 && path.ends_with('/')) {
        path.remove_suffix(1);
    }
    return std::string{path};
}

auto parse_migration_config(std::string_view json_content) noexcept
    -> std::expected<MigrationConfig, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    // Parse mounts (optional, positional arguments override them)
    auto source_mount = parse_string_field(doc, "source_mount");
    if (!source_mount) {
        return std::unexpected(std::move(source_mount.error()));
    }
    config.source_mount = std::move(*source_mount);

    auto dest_mount = parse_string_field(doc, "dest_mount");
    if (!dest_mount) {
        return std::unexpected(std::move(dest_mount.error()));
    }
    config.dest_mount = std::move(*dest_mount);

    // Parse log_file (optional, default /tmp/btrmig.log)
    auto log_file = parse_string_field(doc, "log_file");
    if (!log_file) {
        return std::unexpected(std::move(log_file.error()));
    }
    if (*log_file) {
        if ((*log_file)->empty()) {
            return std::unexpected("'log_file' must not be empty");
        }
        config.log_file = std::move(**log_file);
    }

    // Parse flags (optional, default false)
    if (auto parsed = parse_bool_field(doc, "dry_run", config.dry_run); !parsed) {
        return std::unexpected(std::move(parsed.error()));
    }
    if (auto parsed = parse_bool_field(doc, "assume_yes", config.assume_yes); !parsed) {
        return std::unexpected(std::move(parsed.error()));
    }
    if (auto parsed = parse_bool_field(doc, "verbose", config.verbose); !parsed) {
        return std::unexpected(std::move(parsed.error()));
    }

    return config;
}

auto merge_cli_options(MigrationConfig config, const CliOptions& options) noexcept -> MigrationConfig {
    if (options.source_mount) {
        config.source_mount = options.source_mount;
    }
    if (options.dest_mount) {
        config.dest_mount = options.dest_mount;
    }
    if (options.log_file) {
        config.log_file = *options.log_file;
    }

    // flags can only switch behaviour on
    config.dry_run    = config.dry_run || options.dry_run;
    config.assume_yes = config.assume_yes || options.assume_yes;
    config.verbose    = config.verbose || options.verbose;

    if (config.source_mount) {
        config.source_mount = normalize_mount_path(*config.source_mount);
    }
    if (config.dest_mount) {
        config.dest_mount = normalize_mount_path(*config.dest_mount);
    }
    return config;
}

auto validate_migration_config(const MigrationConfig& config) noexcept
    -> std::expected<void, std::string> {
    std::string missing_fields;
    if (!config.source_mount || config.source_mount->empty()) {
        missing_fields += "'source_mount', ";
    }
    if (!config.dest_mount || config.dest_mount->empty()) {
        missing_fields += "'dest_mount', ";
    }
    if (!missing_fields.empty()) {
        missing_fields.resize(missing_fields.size() - 2);
        return std::unexpected(fmt::format(FMT_COMPILE("Migration requires: {}"), missing_fields));
    }

    for (const auto& mount : {*config.source_mount, *config.dest_mount}) {
        if (!mount.starts_with('/')) {
            return std::unexpected(fmt::format(FMT_COMPILE("Mount path '{}' must be absolute"), mount));
        }
    }

    if (normalize_mount_path(*config.source_mount) == normalize_mount_path(*config.dest_mount)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Source and destination are the same path '{}'"), *config.source_mount));
    }

    return {};
}

}  // namespace migrator
