/**
 * @file duration.hpp
 * @brief Compact rate-limit reset timestamp parsing utilities.
 *
 * Provides functions to parse the terse multi-unit timestamps reported in
 * rate-limit response headers (e.g. "6m45s99ms", "1h30m15s1ms") into
 * std::chrono::milliseconds.
 */
#ifndef RESETSPAN_UTIL_DURATION_HPP
#define RESETSPAN_UTIL_DURATION_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace rspan {

/**
 * Raised when a reset timestamp is rejected or one of its segments does not
 * fit the numeric range.
 */
class TimestampFormatError : public std::runtime_error {
public:
  /**
   * Construct the error for the offending timestamp.
   *
   * @param input Raw timestamp exactly as supplied by the caller.
   * @param reason Short description of the failure.
   */
  TimestampFormatError(const std::string &input, const std::string &reason);

  /// Timestamp that failed to parse, unmodified.
  const std::string &input() const noexcept { return input_; }

private:
  std::string input_;
};

/// How much of the input a successful parse has to consume.
enum class TimestampParseMode {
  Lenient, ///< Anchored at the start, trailing content ignored
  Strict   ///< The whole string has to match
};

/**
 * Magnitudes of the hour, minute, second and millisecond segments of a reset
 * timestamp. Segments missing from the input are zero.
 */
struct TimestampSegments {
  int hours{0};
  int minutes{0};
  int seconds{0};
  int milliseconds{0};

  /**
   * Combine the segments into one interval. Hours, minutes and seconds form
   * the base interval and milliseconds are added as a separate term.
   */
  std::chrono::milliseconds to_duration() const;

  bool operator==(const TimestampSegments &other) const {
    return hours == other.hours && minutes == other.minutes &&
           seconds == other.seconds && milliseconds == other.milliseconds;
  }
  bool operator!=(const TimestampSegments &other) const {
    return !(*this == other);
  }
};

/**
 * Split a reset timestamp into its segments.
 *
 * Segments are optional and must appear in the order h, m, s, ms. An "m" that
 * is immediately followed by "s" starts a millisecond segment rather than
 * closing a minute segment.
 *
 * @param timestamp Raw header value; an empty string yields all zeros.
 * @param mode Whether trailing unmatched content is tolerated.
 * @return Parsed segment magnitudes.
 * @throws TimestampFormatError If a segment overflows or trailing content
 *         is found in strict mode.
 */
TimestampSegments
parse_timestamp_segments(const std::string &timestamp,
                         TimestampParseMode mode = TimestampParseMode::Lenient);

/**
 * Parse a reset timestamp (e.g. "6m45s99ms") into milliseconds.
 *
 * @param timestamp Raw header value such as x-ratelimit-reset-tokens.
 * @param mode Whether trailing unmatched content is tolerated.
 * @return Total duration represented by the timestamp.
 * @throws TimestampFormatError When the timestamp cannot be parsed.
 */
std::chrono::milliseconds
parse_reset_timestamp(const std::string &timestamp,
                      TimestampParseMode mode = TimestampParseMode::Lenient);

/**
 * Non-throwing variant of parse_reset_timestamp().
 *
 * @return Parsed duration, or std::nullopt when the timestamp is malformed.
 */
std::optional<std::chrono::milliseconds> try_parse_reset_timestamp(
    const std::string &timestamp,
    TimestampParseMode mode = TimestampParseMode::Lenient);

/**
 * Convert a parse mode name ("lenient" or "strict", case-insensitive).
 *
 * @throws std::invalid_argument For any other name.
 */
TimestampParseMode parse_mode_from_string(const std::string &name);

/// Lowercase name of a parse mode.
const char *to_string(TimestampParseMode mode);

} // namespace rspan

#endif // RESETSPAN_UTIL_DURATION_HPP
