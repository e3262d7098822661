#ifndef RESETSPAN_CONFIG_HPP
#define RESETSPAN_CONFIG_HPP

#include "util/duration.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>

namespace rspan {

/// Output format of the command line tool.
enum class OutputFormat { Text, Json };

/**
 * Convert "text" or "json" (case-insensitive) into an OutputFormat.
 *
 * @throws std::invalid_argument For any other value.
 */
OutputFormat output_format_from_string(const std::string &name);

/// Lowercase name of an output format.
const char *to_string(OutputFormat format);

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Parse mode applied to reset timestamps.
  TimestampParseMode parse_mode() const { return parse_mode_; }

  /// Set the parse mode applied to reset timestamps.
  void set_parse_mode(TimestampParseMode mode) { parse_mode_ = mode; }

  /// Output format for reports.
  OutputFormat output_format() const { return output_format_; }

  /// Set the output format for reports.
  void set_output_format(OutputFormat format) { output_format_ = format; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set rotated log file count; negative values are clamped to zero.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated logs.
  void set_log_compress(bool compress) { log_compress_ = compress; }

  /// Category -> level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace the category level overrides.
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /// Load configuration from the file at `path`.
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate this configuration from a JSON object.
  void load_json(const nlohmann::json &j);

private:
  bool verbose_ = false;
  TimestampParseMode parse_mode_ = TimestampParseMode::Lenient;
  OutputFormat output_format_ = OutputFormat::Text;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace rspan

#endif // RESETSPAN_CONFIG_HPP
