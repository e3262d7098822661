#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "log.hpp"
#include "report.hpp"
#include "response_headers.hpp"
#include "response_metadata.hpp"
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rspan {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

/**
 * Execute the main application flow: CLI parsing, configuration loading,
 * logger initialization, then the timestamp and header reports.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if any input failed.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("Cannot load configuration {}: {}",
                       options_.config_file, e.what());
      should_exit_ = true;
      return 1;
    }
  }
  merge_config();
  init_logging();

  if (options_.timestamps.empty() && options_.headers_file.empty()) {
    app_log()->error("Nothing to do: pass TIMESTAMP arguments or --headers "
                     "FILE (see --help)");
    should_exit_ = true;
    return 1;
  }
  app_log()->debug("Parsing {} timestamp(s) in {} mode",
                   options_.timestamps.size(), to_string(options_.parse_mode));

  int rc = 0;
  if (options_.output_format == OutputFormat::Json) {
    nlohmann::json doc = nlohmann::json::object();
    if (!options_.timestamps.empty()) {
      nlohmann::json items = nlohmann::json::array();
      for (const auto &ts : options_.timestamps) {
        try {
          items.push_back(timestamp_report_json(
              ts, parse_timestamp_segments(ts, options_.parse_mode)));
        } catch (const TimestampFormatError &e) {
          app_log()->error("{}", e.what());
          items.push_back(timestamp_error_json(e));
          rc = 1;
        }
      }
      doc["timestamps"] = std::move(items);
    }
    if (!options_.headers_file.empty()) {
      try {
        doc["metadata"] =
            ResponseMetadata::from_headers(load_headers(), options_.parse_mode)
                .to_json();
      } catch (const std::exception &e) {
        app_log()->error("{}", e.what());
        rc = 1;
      }
    }
    // Inputs are echoed back and may not be valid UTF-8.
    *out_ << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
          << '\n';
    return rc;
  }

  if (report_timestamps() != 0) {
    rc = 1;
  }
  if (!options_.headers_file.empty() && report_headers() != 0) {
    rc = 1;
  }
  return rc;
}

/**
 * Fill options that were not given on the command line from the loaded
 * configuration.
 */
void App::merge_config() {
  options_.verbose = options_.verbose || config_.verbose();
  if (!options_.parse_mode_explicit) {
    options_.parse_mode = config_.parse_mode();
  } else {
    config_.set_parse_mode(options_.parse_mode);
  }
  if (!options_.output_format_explicit) {
    options_.output_format = config_.output_format();
  } else {
    config_.set_output_format(options_.output_format);
  }
  if (!options_.log_level_explicit) {
    options_.log_level = config_.log_level();
  }
  if (options_.log_file.empty()) {
    options_.log_file = config_.log_file();
  }
  if (!options_.log_rotate_explicit) {
    options_.log_rotate = config_.log_rotate();
  }
  if (!options_.log_compress_explicit) {
    options_.log_compress = config_.log_compress();
  }
  if (!options_.log_categories_explicit) {
    options_.log_categories = config_.log_categories();
  } else {
    config_.set_log_categories(options_.log_categories);
  }
}

void App::init_logging() const {
  std::string level_str = options_.log_level;
  if (options_.verbose && !options_.log_level_explicit &&
      level_str == "info") {
    level_str = "debug";
  }
  LogSettings settings;
  settings.level = level_from_string(level_str, spdlog::level::n_levels);
  const bool unknown_level = settings.level == spdlog::level::n_levels;
  if (unknown_level) {
    settings.level = spdlog::level::info;
  }
  settings.pattern = config_.log_pattern();
  settings.file = options_.log_file;
  settings.rotate_files = static_cast<std::size_t>(options_.log_rotate);
  settings.compress_rotations = options_.log_compress;
  init_logger(settings);
  if (unknown_level) {
    app_log()->warn("Unknown log level '{}', using info", level_str);
  }

  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level] : options_.log_categories) {
    auto parsed = level_from_string(level, spdlog::level::n_levels);
    if (parsed == spdlog::level::n_levels) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
}

/// Print one line per timestamp. Returns 1 if any failed to parse.
int App::report_timestamps() {
  int rc = 0;
  for (const auto &ts : options_.timestamps) {
    try {
      auto segments = parse_timestamp_segments(ts, options_.parse_mode);
      *out_ << timestamp_report_text(ts, segments) << '\n';
    } catch (const TimestampFormatError &e) {
      app_log()->error("{}", e.what());
      *out_ << (ts.empty() ? "\"\"" : ts) << " -> error\n";
      rc = 1;
    }
  }
  return rc;
}

ResponseHeaders App::load_headers() const {
  if (options_.headers_file == "-") {
    return ResponseHeaders::from_stream(*in_);
  }
  return ResponseHeaders::from_file(options_.headers_file);
}

int App::report_headers() {
  try {
    auto headers = load_headers();
    if (headers.size() == 0) {
      app_log()->warn("No headers found in {}", options_.headers_file);
    }
    auto meta = ResponseMetadata::from_headers(headers, options_.parse_mode);
    *out_ << metadata_report_text(meta);
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
  return 0;
}

} // namespace rspan
