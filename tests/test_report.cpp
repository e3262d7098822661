#include "report.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

using namespace rspan;
using namespace std::chrono;

TEST_CASE("describe_duration renders non-zero components") {
  CHECK(describe_duration(milliseconds{0}) == "0ms");
  CHECK(describe_duration(minutes{6} + seconds{45} + milliseconds{99}) ==
        "6m 45s 99ms");
  CHECK(describe_duration(hours{1}) == "1h");
  CHECK(describe_duration(hours{1} + milliseconds{1}) == "1h 1ms");
  CHECK(describe_duration(milliseconds{60500}) == "1m 500ms");
  CHECK(describe_duration(hours{26}) == "26h");
}

TEST_CASE("timestamp reports") {
  auto segments = parse_timestamp_segments("6m45s99ms");
  CHECK(timestamp_report_text("6m45s99ms", segments) ==
        "6m45s99ms -> 6m 45s 99ms (405099 ms)");
  CHECK(timestamp_report_text("", TimestampSegments{}) == "\"\" -> 0ms (0 ms)");

  auto j = timestamp_report_json("1h30m15s1ms",
                                 parse_timestamp_segments("1h30m15s1ms"));
  CHECK(j["input"] == "1h30m15s1ms");
  CHECK(j["hours"] == 1);
  CHECK(j["minutes"] == 30);
  CHECK(j["seconds"] == 15);
  CHECK(j["milliseconds"] == 1);
  CHECK(j["total_ms"] == 5415001);
}

TEST_CASE("timestamp error report keeps the input") {
  TimestampFormatError error("7s?", "unexpected trailing content '?'");
  auto j = timestamp_error_json(error);
  CHECK(j["input"] == "7s?");
  CHECK(j["error"].get<std::string>().find("7s?") != std::string::npos);
}

TEST_CASE("metadata text report") {
  auto meta = ResponseMetadata::from_headers(ResponseHeaders::from_lines({
      "x-request-id: req_1",
      "x-ratelimit-limit-requests: 60",
      "x-ratelimit-reset-requests: 1s",
      "x-ratelimit-reset-tokens: 1s?",
  }), TimestampParseMode::Strict);
  auto text = metadata_report_text(meta);
  CHECK(text.find("request id:         req_1\n") != std::string::npos);
  CHECK(text.find("organization:       -\n") != std::string::npos);
  CHECK(text.find("limit requests:     60\n") != std::string::npos);
  CHECK(text.find("reset requests:     1s (1s)\n") != std::string::npos);
  CHECK(text.find("reset tokens:       1s? (unparseable)\n") !=
        std::string::npos);
}
