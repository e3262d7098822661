#include "report.hpp"

#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace rspan {

namespace {

std::string or_dash(const std::string &value) {
  return value.empty() ? std::string{"-"} : value;
}

std::string or_dash(const std::optional<int> &value) {
  return value ? std::to_string(*value) : std::string{"-"};
}

std::string describe_reset(const std::string &raw, TimestampParseMode mode) {
  if (raw.empty()) {
    return "-";
  }
  try {
    return raw + " (" + describe_duration(parse_reset_timestamp(raw, mode)) +
           ")";
  } catch (const TimestampFormatError &) {
    return raw + " (unparseable)";
  }
}

} // namespace

std::string describe_duration(std::chrono::milliseconds duration) {
  if (duration.count() == 0) {
    return "0ms";
  }
  using namespace std::chrono;
  const auto h = duration_cast<hours>(duration);
  duration -= h;
  const auto m = duration_cast<minutes>(duration);
  duration -= m;
  const auto s = duration_cast<seconds>(duration);
  duration -= s;

  std::ostringstream oss;
  auto append = [&oss](long long value, const char *unit) {
    if (value == 0) {
      return;
    }
    if (oss.tellp() > 0) {
      oss << ' ';
    }
    oss << value << unit;
  };
  append(h.count(), "h");
  append(m.count(), "m");
  append(s.count(), "s");
  append(duration.count(), "ms");
  return oss.str();
}

std::string timestamp_report_text(const std::string &input,
                                  const TimestampSegments &segments) {
  auto total = segments.to_duration();
  std::ostringstream oss;
  oss << (input.empty() ? "\"\"" : input) << " -> "
      << describe_duration(total) << " (" << total.count() << " ms)";
  return oss.str();
}

nlohmann::json timestamp_report_json(const std::string &input,
                                     const TimestampSegments &segments) {
  nlohmann::json j;
  j["input"] = input;
  j["hours"] = segments.hours;
  j["minutes"] = segments.minutes;
  j["seconds"] = segments.seconds;
  j["milliseconds"] = segments.milliseconds;
  j["total_ms"] = segments.to_duration().count();
  return j;
}

nlohmann::json timestamp_error_json(const TimestampFormatError &error) {
  nlohmann::json j;
  j["input"] = error.input();
  j["error"] = error.what();
  return j;
}

std::string metadata_report_text(const ResponseMetadata &meta) {
  std::ostringstream oss;
  oss << "request id:         " << or_dash(meta.request_id()) << '\n';
  oss << "organization:       " << or_dash(meta.organization()) << '\n';
  oss << "api version:        " << or_dash(meta.api_version()) << '\n';
  oss << "processing time:    "
      << (meta.processing_time() ? describe_duration(*meta.processing_time())
                                 : std::string{"-"})
      << '\n';
  oss << "limit requests:     " << or_dash(meta.limit_requests()) << '\n';
  oss << "remaining requests: " << or_dash(meta.remaining_requests()) << '\n';
  oss << "reset requests:     "
      << describe_reset(meta.reset_requests(), meta.parse_mode()) << '\n';
  oss << "limit tokens:       " << or_dash(meta.limit_tokens()) << '\n';
  oss << "remaining tokens:   " << or_dash(meta.remaining_tokens()) << '\n';
  oss << "reset tokens:       "
      << describe_reset(meta.reset_tokens(), meta.parse_mode()) << '\n';
  return oss.str();
}

} // namespace rspan
