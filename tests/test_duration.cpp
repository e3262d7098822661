#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace rspan;
using namespace std::chrono;

TEST_CASE("parse_reset_timestamp handles documented examples") {
  CHECK(parse_reset_timestamp("") == milliseconds{0});
  CHECK(parse_reset_timestamp("6m45s99ms") ==
        minutes{6} + seconds{45} + milliseconds{99});
  CHECK(parse_reset_timestamp("1h") == hours{1});
  CHECK(parse_reset_timestamp("500ms") == milliseconds{500});
  CHECK(parse_reset_timestamp("1h30m15s1ms") ==
        hours{1} + minutes{30} + seconds{15} + milliseconds{1});
}

TEST_CASE("minute segment is not mistaken for milliseconds") {
  CHECK(parse_reset_timestamp("10m") == minutes{10});
  CHECK(parse_reset_timestamp("10ms") == milliseconds{10});
  CHECK(parse_reset_timestamp("1m1ms") == minutes{1} + milliseconds{1});

  auto segments = parse_timestamp_segments("10m");
  CHECK(segments.minutes == 10);
  CHECK(segments.milliseconds == 0);
}

TEST_CASE("segments carry the value of their digit run") {
  auto segments = parse_timestamp_segments("12h034m5s0999ms");
  CHECK(segments.hours == 12);
  CHECK(segments.minutes == 34);
  CHECK(segments.seconds == 5);
  CHECK(segments.milliseconds == 999);

  auto only_seconds = parse_timestamp_segments("17s");
  CHECK(only_seconds == TimestampSegments{0, 0, 17, 0});

  auto hours_and_ms = parse_timestamp_segments("2h250ms");
  CHECK(hours_and_ms == TimestampSegments{2, 0, 0, 250});
}

TEST_CASE("milliseconds are added without normalising segments") {
  auto segments = parse_timestamp_segments("59s1500ms");
  CHECK(segments.seconds == 59);
  CHECK(segments.milliseconds == 1500);
  CHECK(segments.to_duration() == milliseconds{60500});

  CHECK(parse_reset_timestamp("90m") == minutes{90});
  CHECK(parse_reset_timestamp("3600s") == hours{1});
}

TEST_CASE("lenient mode ignores trailing content") {
  CHECK(parse_reset_timestamp("6m0s") == minutes{6});
  CHECK(parse_reset_timestamp("45s99") == seconds{45});
  CHECK(parse_reset_timestamp("5s3m") == seconds{5});
  CHECK(parse_reset_timestamp("abc") == milliseconds{0});
  CHECK(parse_reset_timestamp(" 1s") == milliseconds{0});
  CHECK(parse_reset_timestamp("1.5s") == milliseconds{0});
}

TEST_CASE("strict mode rejects trailing content") {
  const auto strict = TimestampParseMode::Strict;
  CHECK(parse_reset_timestamp("", strict) == milliseconds{0});
  CHECK(parse_reset_timestamp("6m45s99ms", strict) ==
        minutes{6} + seconds{45} + milliseconds{99});
  CHECK_THROWS_AS(parse_reset_timestamp("45s99", strict), TimestampFormatError);
  CHECK_THROWS_AS(parse_reset_timestamp("5s3m", strict), TimestampFormatError);
  CHECK_THROWS_AS(parse_reset_timestamp("abc", strict), TimestampFormatError);
  CHECK_THROWS_AS(parse_reset_timestamp("1s ", strict), TimestampFormatError);
}

TEST_CASE("format error carries the unmodified input") {
  const std::string input = "1s trailing";
  try {
    parse_reset_timestamp(input, TimestampParseMode::Strict);
    FAIL("expected TimestampFormatError");
  } catch (const TimestampFormatError &e) {
    CHECK(e.input() == input);
    CHECK(std::string(e.what()).find(input) != std::string::npos);
  }
}

TEST_CASE("overflowing segment is a format error") {
  const std::string input = "99999999999h";
  CHECK_THROWS_AS(parse_reset_timestamp(input), TimestampFormatError);
  try {
    parse_timestamp_segments(input);
    FAIL("expected TimestampFormatError");
  } catch (const TimestampFormatError &e) {
    CHECK(e.input() == input);
  }
  CHECK(parse_reset_timestamp("2147483647ms") == milliseconds{2147483647});
}

TEST_CASE("very long header values are scanned without failure") {
  const std::string digits_then_junk = std::string(100000, '1') + "x";
  CHECK(parse_reset_timestamp(digits_then_junk) == milliseconds{0});
  try {
    parse_reset_timestamp(digits_then_junk, TimestampParseMode::Strict);
    FAIL("expected TimestampFormatError");
  } catch (const TimestampFormatError &e) {
    CHECK(e.input() == digits_then_junk);
  }

  const std::string padded = std::string(100000, '0') + "7s";
  CHECK(parse_reset_timestamp(padded, TimestampParseMode::Strict) ==
        seconds{7});

  const std::string long_tail = "3s" + std::string(100000, 'z');
  CHECK(parse_reset_timestamp(long_tail) == seconds{3});

  CHECK_THROWS_AS(parse_reset_timestamp(std::string(100000, '9') + "ms"),
                  TimestampFormatError);
}

TEST_CASE("try_parse_reset_timestamp reports failure without throwing") {
  CHECK(try_parse_reset_timestamp("6m45s99ms") ==
        minutes{6} + seconds{45} + milliseconds{99});
  CHECK_FALSE(try_parse_reset_timestamp("99999999999ms").has_value());
  CHECK_FALSE(
      try_parse_reset_timestamp("1x", TimestampParseMode::Strict).has_value());
  CHECK(try_parse_reset_timestamp("1x") == seconds{0});
}

TEST_CASE("parsing is deterministic across calls and threads") {
  const std::vector<std::string> inputs = {"", "1h", "6m45s99ms", "500ms",
                                           "1h30m15s1ms", "10m"};
  std::vector<milliseconds> first;
  for (const auto &input : inputs) {
    first.push_back(parse_reset_timestamp(input));
  }
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    CHECK(parse_reset_timestamp(inputs[i]) == first[i]);
  }

  std::vector<std::vector<milliseconds>> results(4);
  std::vector<std::thread> workers;
  for (std::size_t t = 0; t < results.size(); ++t) {
    workers.emplace_back([&, t] {
      for (int round = 0; round < 100; ++round) {
        for (const auto &input : inputs) {
          results[t].push_back(parse_reset_timestamp(input));
        }
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
  for (const auto &result : results) {
    REQUIRE(result.size() == inputs.size() * 100);
    for (std::size_t i = 0; i < result.size(); ++i) {
      CHECK(result[i] == first[i % inputs.size()]);
    }
  }
}

TEST_CASE("parse mode names") {
  CHECK(parse_mode_from_string("strict") == TimestampParseMode::Strict);
  CHECK(parse_mode_from_string("Lenient") == TimestampParseMode::Lenient);
  CHECK_THROWS_AS(parse_mode_from_string("loose"), std::invalid_argument);
  CHECK(std::string(to_string(TimestampParseMode::Strict)) == "strict");
  CHECK(std::string(to_string(TimestampParseMode::Lenient)) == "lenient");
}
