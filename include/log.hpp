/**
 * @file log.hpp
 * @brief Logging utilities for git-prune-merged.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef GIT_PRUNE_MERGED_LOG_HPP
#define GIT_PRUNE_MERGED_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace gpm {

/**
 * Initialize the global logger with a console sink and an optional file sink.
 *
 * Diagnostics go to stderr so that the branch report written to stdout stays
 * machine readable.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        default pattern.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Number of rotated files to keep for @p file. Zero
 *        writes a single, non-rotating file.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 0);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Category name; the logger is registered as "gpm.<name>".
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Creates a warn-level stderr logger on demand when the logging subsystem has
 * not been explicitly initialized.
 */
void ensure_default_logger();

} // namespace gpm

#endif // GIT_PRUNE_MERGED_LOG_HPP
