#ifndef SUMMARY_HPP
#define SUMMARY_HPP

#include "btrmig/migration.hpp"

#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace btrmig::summary {

/// Process exit codes consumed by automation.
inline constexpr std::int32_t kExitSuccess         = 0;
inline constexpr std::int32_t kExitMigrationFailed = 1;
inline constexpr std::int32_t kExitFatal           = 2;

/// @brief Exit code for a finished run, 0 only when no subvolume failed.
auto summary_exit_code(const migration::RunSummary& summary) noexcept -> std::int32_t;

/// @brief One line per subvolume, e.g. "@home: failed (transfer failed)".
auto format_result_line(const migration::SubvolumeResult& result) noexcept -> std::string;

/// @brief Plain text report with counts and every outcome.
auto format_summary(const migration::RunSummary& summary) noexcept -> std::string;

/// @brief Follow-up hints printed after a successful run.
auto next_steps(std::string_view destination) noexcept -> std::vector<std::string>;

}  // namespace btrmig::summary

#endif  // SUMMARY_HPP
