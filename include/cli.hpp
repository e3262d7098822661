/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for resetspan.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef RESETSPAN_CLI_HPP
#define RESETSPAN_CLI_HPP

#include "config.hpp"
#include "util/duration.hpp"
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace rspan {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /**
   * Retrieve the exit code that triggered the exception.
   *
   * @return Numeric process exit code.
   */
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * `*_explicit` flags record whether a value came from the command line so it
 * can take precedence over the configuration file.
 */
struct CliOptions {
  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string log_level = "info"; ///< Logging verbosity level
  bool log_level_explicit{false}; ///< True if CLI set the log level
  std::string log_file;           ///< Optional path to rotating log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_compress{false};          ///< Compress rotated log files
  bool log_rotate_explicit{false};   ///< True if CLI set log rotation count
  bool log_compress_explicit{false}; ///< True if CLI toggled log compression
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI/config
  bool log_categories_explicit{false}; ///< True if CLI specified categories
  TimestampParseMode parse_mode{
      TimestampParseMode::Lenient}; ///< Reset timestamp parse mode
  bool parse_mode_explicit{false};  ///< True if --strict/--lenient was given
  OutputFormat output_format{OutputFormat::Text}; ///< Report format
  bool output_format_explicit{false}; ///< True if CLI set --output
  std::string headers_file; ///< Header dump to report on ("-" for stdin)
  std::vector<std::string> timestamps; ///< Timestamps to parse
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing encounters conditions such as `--help`
 *         or invalid arguments that require the application to exit early.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace rspan

#endif // RESETSPAN_CLI_HPP
