#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

using namespace rspan;

TEST_CASE("level names") {
  CHECK(level_from_string("debug", spdlog::level::info) ==
        spdlog::level::debug);
  CHECK(level_from_string("WARN", spdlog::level::info) == spdlog::level::warn);
  CHECK(level_from_string("off", spdlog::level::info) == spdlog::level::off);
  CHECK(level_from_string("chatty", spdlog::level::err) == spdlog::level::err);
}

TEST_CASE("test log") {
  const char *path = "test.log";
  std::remove(path);
  LogSettings settings;
  settings.level = spdlog::level::info;
  settings.file = path;
  init_logger(settings);

  spdlog::debug("debug message");
  spdlog::info("info message");

  auto metadata = category_logger("metadata");
  metadata->debug("category debug hidden");
  configure_log_categories({{"metadata", spdlog::level::debug}});
  CHECK(metadata->level() == spdlog::level::debug);
  metadata->debug("category debug shown");
  CHECK(category_logger("metadata") == metadata);

  shutdown_logger();
  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
  REQUIRE(content.find("category debug hidden") == std::string::npos);
  REQUIRE(content.find("category debug shown") != std::string::npos);
  REQUIRE(content.find("resetspan.metadata") != std::string::npos);
  f.close();
  std::remove(path);
}
