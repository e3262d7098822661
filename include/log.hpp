/**
 * @file log.hpp
 * @brief Logging utilities for resetspan.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef RESETSPAN_LOG_HPP
#define RESETSPAN_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace rspan {

/// Settings for the default logger.
struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string pattern;      ///< Empty keeps the spdlog default pattern
  std::string file;         ///< Optional log file, empty for console only
  std::size_t rotate_files{3}; ///< Rotated files to keep (0 = no rotation)
  bool compress_rotations{false}; ///< gzip rotated files
};

/**
 * Initialize the global logger with a console sink and an optional file sink.
 *
 * Calling this again after the logger exists only updates level and pattern.
 *
 * @param settings Level, pattern and file output to use.
 */
void init_logger(const LogSettings &settings);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Category name; the logger is registered as
 *        `resetspan.<category>`.
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
 * Creates one at info level when the logging subsystem has not been
 * explicitly initialized.
 */
void ensure_default_logger();

/**
 * Convert a level name such as "debug" or "warn".
 *
 * @param name Level name accepted by spdlog.
 * @param fallback Level returned when @p name is not recognised.
 */
spdlog::level::level_enum level_from_string(const std::string &name,
                                            spdlog::level::level_enum fallback);

/// Flush and drop every logger. Used before process exit and in tests.
void shutdown_logger();

} // namespace rspan

#endif // RESETSPAN_LOG_HPP
