#include "util/duration.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace rspan {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

/**
 * Consume one "<digits><unit>" segment starting at @p pos.
 *
 * The segment is only taken when the digit run is followed by @p unit and,
 * if @p reject_next is set, the unit is not followed by that character. This
 * keeps "5ms" from being read as a five minute segment.
 *
 * @param ts Timestamp being scanned.
 * @param pos Scan position, advanced past the segment when it is taken.
 * @return Digit run of the segment, empty when the segment is absent.
 */
std::string take_segment(const std::string &ts, std::size_t &pos,
                         std::string_view unit, char reject_next = '\0') {
  std::size_t end = pos;
  while (end < ts.size() && is_digit(ts[end])) {
    ++end;
  }
  if (end == pos || ts.compare(end, unit.size(), unit) != 0) {
    return {};
  }
  const std::size_t after = end + unit.size();
  if (reject_next != '\0' && after < ts.size() && ts[after] == reject_next) {
    return {};
  }
  std::string digits = ts.substr(pos, end - pos);
  pos = after;
  return digits;
}

int segment_value(const std::string &digits, const std::string &timestamp) {
  if (digits.empty()) {
    return 0;
  }
  try {
    return std::stoi(digits);
  } catch (const std::out_of_range &) {
    throw TimestampFormatError(timestamp,
                               "segment '" + digits + "' out of range");
  } catch (const std::invalid_argument &) {
    throw TimestampFormatError(timestamp,
                               "segment '" + digits + "' is not a number");
  }
}

} // namespace

TimestampFormatError::TimestampFormatError(const std::string &input,
                                           const std::string &reason)
    : std::runtime_error("Could not parse timestamp header '" + input +
                         "': " + reason),
      input_(input) {}

std::chrono::milliseconds TimestampSegments::to_duration() const {
  auto base = std::chrono::hours(hours) + std::chrono::minutes(minutes) +
              std::chrono::seconds(seconds);
  return std::chrono::duration_cast<std::chrono::milliseconds>(base) +
         std::chrono::milliseconds(milliseconds);
}

/**
 * Scan the timestamp left to right, taking each optional segment in the
 * order h, m, s, ms. The scan is a single forward pass, so arbitrarily long
 * header values are handled in linear time.
 *
 * @param timestamp Raw header value.
 * @param mode Lenient ignores trailing content, strict rejects it.
 * @return Segment magnitudes, zero for absent segments.
 * @throws TimestampFormatError When a value overflows, or trailing content
 *         remains in strict mode.
 */
TimestampSegments parse_timestamp_segments(const std::string &timestamp,
                                           TimestampParseMode mode) {
  std::size_t pos = 0;
  const std::string hours = take_segment(timestamp, pos, "h");
  const std::string minutes = take_segment(timestamp, pos, "m", 's');
  const std::string seconds = take_segment(timestamp, pos, "s");
  const std::string millis = take_segment(timestamp, pos, "ms");
  if (mode == TimestampParseMode::Strict && pos != timestamp.size()) {
    throw TimestampFormatError(timestamp, "unexpected trailing content '" +
                                              timestamp.substr(pos) + "'");
  }

  TimestampSegments segments;
  segments.hours = segment_value(hours, timestamp);
  segments.minutes = segment_value(minutes, timestamp);
  segments.seconds = segment_value(seconds, timestamp);
  segments.milliseconds = segment_value(millis, timestamp);
  return segments;
}

std::chrono::milliseconds parse_reset_timestamp(const std::string &timestamp,
                                                TimestampParseMode mode) {
  return parse_timestamp_segments(timestamp, mode).to_duration();
}

std::optional<std::chrono::milliseconds>
try_parse_reset_timestamp(const std::string &timestamp,
                          TimestampParseMode mode) {
  try {
    return parse_reset_timestamp(timestamp, mode);
  } catch (const TimestampFormatError &) {
    return std::nullopt;
  }
}

TimestampParseMode parse_mode_from_string(const std::string &name) {
  std::string lower = name;
  std::transform(
      lower.begin(), lower.end(), lower.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "lenient") {
    return TimestampParseMode::Lenient;
  }
  if (lower == "strict") {
    return TimestampParseMode::Strict;
  }
  throw std::invalid_argument("Invalid timestamp parse mode: " + name);
}

const char *to_string(TimestampParseMode mode) {
  switch (mode) {
  case TimestampParseMode::Strict:
    return "strict";
  case TimestampParseMode::Lenient:
    return "lenient";
  }
  return "lenient";
}

} // namespace rspan
