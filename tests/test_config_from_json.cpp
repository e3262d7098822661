#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace rspan;

TEST_CASE("test config from json") {
  nlohmann::json j;
  auto &core = j["core"];
  core["verbose"] = true;

  auto &parsing = j["parsing"];
  parsing["strict_timestamps"] = true;

  auto &output = j["output"];
  output["output_format"] = "JSON";

  auto &logging = j["logging"];
  logging["log_level"] = "trace";
  logging["log_rotate"] = 7;
  logging["log_compress"] = true;
  logging["log_categories"] = {{"metadata", "trace"}, {"headers", nullptr}};

  Config cfg = Config::from_json(j);
  CHECK(cfg.verbose());
  CHECK(cfg.parse_mode() == TimestampParseMode::Strict);
  CHECK(cfg.output_format() == OutputFormat::Json);
  CHECK(cfg.log_level() == "trace");
  CHECK(cfg.log_rotate() == 7);
  CHECK(cfg.log_compress());
  CHECK(cfg.log_categories().at("metadata") == "trace");
  CHECK(cfg.log_categories().at("headers") == "debug");
}

TEST_CASE("parse_mode overrides strict_timestamps") {
  nlohmann::json j;
  j["strict_timestamps"] = true;
  j["parse_mode"] = "lenient";
  CHECK(Config::from_json(j).parse_mode() == TimestampParseMode::Lenient);
}

TEST_CASE("single log category string") {
  nlohmann::json j;
  j["log_categories"] = "cli=warn";
  auto cfg = Config::from_json(j);
  REQUIRE(cfg.log_categories().size() == 1);
  CHECK(cfg.log_categories().at("cli") == "warn");
}

TEST_CASE("invalid enumerations are rejected") {
  nlohmann::json mode;
  mode["parse_mode"] = "fuzzy";
  CHECK_THROWS_AS(Config::from_json(mode), std::runtime_error);

  nlohmann::json format;
  format["output_format"] = "csv";
  CHECK_THROWS_AS(Config::from_json(format), std::runtime_error);

  nlohmann::json wrong_type;
  wrong_type["log_rotate"] = "many";
  CHECK_THROWS_AS(Config::from_json(wrong_type), nlohmann::json::exception);
}
