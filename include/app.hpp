/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for resetspan.
 *
 * Declares the App class, which manages CLI parsing, configuration loading,
 * logger setup and report output for the resetspan tool.
 */

#ifndef RESETSPAN_APP_HPP
#define RESETSPAN_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "response_headers.hpp"
#include <iostream>

namespace rspan {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * @param out Stream receiving reports.
   * @param in Stream read when the header file is "-".
   */
  explicit App(std::ostream &out = std::cout, std::istream &in = std::cin)
      : out_(&out), in_(&in) {}

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero when every input was parsed, non-zero when a timestamp or
   *         header source failed or the arguments were invalid.
   */
  int run(int argc, char **argv);

  /**
   * Retrieve the parsed command line options merged with the configuration.
   *
   * @return Immutable reference to the populated CLI options structure.
   */
  const CliOptions &options() const { return options_; }

  /**
   * Retrieve the loaded configuration.
   *
   * @return Immutable reference to the resolved configuration values.
   */
  const Config &config() const { return config_; }

  /**
   * Determine whether the run ended before any input was processed
   * (help, version, or argument errors).
   */
  bool should_exit() const { return should_exit_; }

private:
  void merge_config();
  void init_logging() const;
  int report_timestamps();
  int report_headers();
  ResponseHeaders load_headers() const;

  std::ostream *out_;
  std::istream *in_;
  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace rspan

#endif // RESETSPAN_APP_HPP
