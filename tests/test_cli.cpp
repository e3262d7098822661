#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>

using rspan::CliOptions;
using rspan::CliParseExit;
using rspan::OutputFormat;
using rspan::TimestampParseMode;
using rspan::parse_cli;

TEST_CASE("test cli", "[cli]") {
  char prog[] = "prog";
  char verbose[] = "--verbose";
  char *argv1[] = {prog, verbose};
  CliOptions opts = parse_cli(2, argv1);
  REQUIRE(opts.verbose);

  char *argv2[] = {prog};
  CliOptions opts2 = parse_cli(1, argv2);
  REQUIRE(!opts2.verbose);
  REQUIRE(opts2.timestamps.empty());
  REQUIRE(opts2.parse_mode == TimestampParseMode::Lenient);
  REQUIRE(!opts2.parse_mode_explicit);
  REQUIRE(opts2.output_format == OutputFormat::Text);

  char config_flag[] = "--config";
  char file[] = "cfg.yaml";
  char *argv3[] = {prog, config_flag, file};
  CliOptions opts3 = parse_cli(3, argv3);
  REQUIRE(opts3.config_file == "cfg.yaml");

  char log_flag[] = "--log-level";
  char debug_lvl[] = "debug";
  char *argv4[] = {prog, log_flag, debug_lvl};
  CliOptions opts4 = parse_cli(3, argv4);
  REQUIRE(opts4.log_level == "debug");
  REQUIRE(opts4.log_level_explicit);

  char log_file_flag[] = "--log-file";
  char path[] = "app.log";
  char *argv5[] = {prog, log_file_flag, path};
  CliOptions opts5 = parse_cli(3, argv5);
  REQUIRE(opts5.log_file == "app.log");

  char log_rotate_flag[] = "--log-rotate";
  char log_rotate_val[] = "5";
  char *argv6[] = {prog, log_rotate_flag, log_rotate_val};
  CliOptions opts6 = parse_cli(3, argv6);
  REQUIRE(opts6.log_rotate == 5);
  REQUIRE(opts6.log_rotate_explicit);

  char log_compress_flag[] = "--log-compress";
  char no_log_compress_flag[] = "--no-log-compress";
  char *argv7[] = {prog, log_compress_flag};
  CliOptions opts7 = parse_cli(2, argv7);
  REQUIRE(opts7.log_compress);
  REQUIRE(opts7.log_compress_explicit);

  char *argv8[] = {prog, log_compress_flag, no_log_compress_flag};
  CliOptions opts8 = parse_cli(3, argv8);
  REQUIRE(!opts8.log_compress);
  REQUIRE(opts8.log_compress_explicit);
}

TEST_CASE("cli timestamps and parse mode", "[cli]") {
  char prog[] = "prog";
  char ts1[] = "6m45s99ms";
  char ts2[] = "1h";
  char strict[] = "--strict";
  char lenient[] = "--lenient";

  char *argv1[] = {prog, ts1, strict, ts2};
  CliOptions opts1 = parse_cli(4, argv1);
  REQUIRE(opts1.timestamps.size() == 2);
  CHECK(opts1.timestamps[0] == "6m45s99ms");
  CHECK(opts1.timestamps[1] == "1h");
  CHECK(opts1.parse_mode == TimestampParseMode::Strict);
  CHECK(opts1.parse_mode_explicit);

  // last toggle wins
  char *argv2[] = {prog, strict, lenient, ts1};
  CliOptions opts2 = parse_cli(4, argv2);
  CHECK(opts2.parse_mode == TimestampParseMode::Lenient);
  CHECK(opts2.parse_mode_explicit);
}

TEST_CASE("cli headers and output format", "[cli]") {
  char prog[] = "prog";
  char headers_flag[] = "-H";
  char dash[] = "-";
  char output_flag[] = "-o";
  char json[] = "JSON";
  char *argv1[] = {prog, headers_flag, dash, output_flag, json};
  CliOptions opts = parse_cli(5, argv1);
  CHECK(opts.headers_file == "-");
  CHECK(opts.output_format == OutputFormat::Json);
  CHECK(opts.output_format_explicit);

  char long_headers[] = "--headers";
  char file[] = "dump.txt";
  char *argv2[] = {prog, long_headers, file};
  CHECK(parse_cli(3, argv2).headers_file == "dump.txt");
}

TEST_CASE("cli log categories", "[cli]") {
  char prog[] = "prog";
  char flag[] = "--log-category";
  char metadata[] = "metadata=trace";
  char headers[] = "headers";
  char *argv[] = {prog, flag, metadata, flag, headers};
  CliOptions opts = parse_cli(5, argv);
  REQUIRE(opts.log_categories_explicit);
  REQUIRE(opts.log_categories.size() == 2);
  CHECK(opts.log_categories.at("metadata") == "trace");
  CHECK(opts.log_categories.at("headers") == "debug");
}

TEST_CASE("cli errors request exit", "[cli]") {
  char prog[] = "prog";

  char output_flag[] = "--output";
  char xml[] = "xml";
  char *argv1[] = {prog, output_flag, xml};
  try {
    (void)parse_cli(3, argv1);
    FAIL("expected CliParseExit");
  } catch (const CliParseExit &e) {
    CHECK(e.exit_code() != 0);
  }

  char rotate_flag[] = "--log-rotate";
  char negative[] = "-1";
  char *argv2[] = {prog, rotate_flag, negative};
  CHECK_THROWS_AS(parse_cli(3, argv2), CliParseExit);

  char category_flag[] = "--log-category";
  char no_name[] = "=debug";
  char *argv3[] = {prog, category_flag, no_name};
  CHECK_THROWS_AS(parse_cli(3, argv3), CliParseExit);

  char unknown[] = "--bogus";
  char *argv4[] = {prog, unknown};
  CHECK_THROWS_AS(parse_cli(2, argv4), CliParseExit);

  char help[] = "--help";
  char *argv5[] = {prog, help};
  try {
    (void)parse_cli(2, argv5);
    FAIL("expected CliParseExit");
  } catch (const CliParseExit &e) {
    CHECK(e.exit_code() == 0);
  }
}
