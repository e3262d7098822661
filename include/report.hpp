/**
 * @file report.hpp
 * @brief Text and JSON rendering of parsed timestamps and response metadata.
 */
#ifndef RESETSPAN_REPORT_HPP
#define RESETSPAN_REPORT_HPP

#include "response_metadata.hpp"
#include "util/duration.hpp"
#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace rspan {

/**
 * Human-readable rendering such as "6m 45s 99ms". Zero renders as "0ms";
 * components that are zero are omitted.
 */
std::string describe_duration(std::chrono::milliseconds duration);

/// One line summary of a parsed timestamp: `6m45s99ms -> 6m 45s 99ms (405099 ms)`.
std::string timestamp_report_text(const std::string &input,
                                  const TimestampSegments &segments);

/// JSON object with the input, every segment, and the total milliseconds.
nlohmann::json timestamp_report_json(const std::string &input,
                                     const TimestampSegments &segments);

/// JSON object describing a timestamp that failed to parse.
nlohmann::json timestamp_error_json(const TimestampFormatError &error);

/// Multi-line "name: value" summary of response metadata.
std::string metadata_report_text(const ResponseMetadata &meta);

} // namespace rspan

#endif // RESETSPAN_REPORT_HPP
