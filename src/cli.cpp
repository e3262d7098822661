#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace rspan {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 7> categories = {
      "app", "cli", "config", "headers", "logging", "main", "metadata"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "metadata=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}
} // namespace

/**
 * Parse command line arguments into the internal option structure.
 *
 * Toggle-style flags (`--strict`/`--lenient`, `--log-compress`/
 * `--no-log-compress`) are consumed before CLI11 sees the arguments so the
 * last occurrence wins and explicit use can be recorded.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Parse rate-limit reset timestamps such as 6m45s99ms and "
               "report response rate-limit headers"};
  app.footer(log_category_help_text());
  CliOptions options;
  std::vector<std::string> filtered_args;
  filtered_args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    std::string arg = argv[i] != nullptr ? argv[i] : "";
    if (i == 0) {
      filtered_args.push_back(std::move(arg));
      continue;
    }
    if (arg == "--log-compress") {
      options.log_compress = true;
      options.log_compress_explicit = true;
      continue;
    }
    if (arg == "--no-log-compress") {
      options.log_compress = false;
      options.log_compress_explicit = true;
      continue;
    }
    if (arg == "--strict") {
      options.parse_mode = TimestampParseMode::Strict;
      options.parse_mode_explicit = true;
      continue;
    }
    if (arg == "--lenient") {
      options.parse_mode = TimestampParseMode::Lenient;
      options.parse_mode_explicit = true;
      continue;
    }
    filtered_args.push_back(std::move(arg));
  }
  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "resetspan " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option("timestamps", options.timestamps,
                 "Reset timestamps to parse, e.g. 6m45s99ms or 1h30m15s1ms")
      ->type_name("TIMESTAMP");
  app.add_option("-H,--headers", options.headers_file,
                 "Report rate-limit metadata from a raw header dump "
                 "('-' reads stdin)")
      ->type_name("FILE")
      ->group("Input");
  app.add_flag("--strict",
               "Reject timestamps with content after the last segment")
      ->group("Input");
  app.add_flag("--lenient",
               "Ignore content after the last recognised segment (default)")
      ->group("Input");
  app.add_option_function<std::string>(
         "-o,--output",
         [&options](const std::string &value) {
           try {
             options.output_format = output_format_from_string(value);
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--output", e.what());
           }
           options.output_format_explicit = true;
         },
         "Output format (text or json)")
      ->type_name("FORMAT")
      ->group("Output");
  app.add_option_function<std::string>(
         "-G,--log-level",
         [&options](const std::string &value) {
           options.log_level = value;
           options.log_level_explicit = true;
         },
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag("--log-compress", "Compress rotated log files with gzip")
      ->group("Logging");
  app.add_flag("--no-log-compress", "Keep rotated log files uncompressed")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  try {
    std::vector<char *> args;
    args.reserve(filtered_args.size() + 1);
    for (auto &s : filtered_args) {
      args.push_back(const_cast<char *>(s.c_str()));
    }
    args.push_back(nullptr);
    int parse_argc = static_cast<int>(filtered_args.size());
    app.parse(parse_argc, args.data());
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  if (options.timestamps.empty() && options.headers_file.empty()) {
    cli_log()->debug("No timestamps or header file given");
  }
  return options;
}

} // namespace rspan
