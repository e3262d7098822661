/**
 * @file response_metadata.hpp
 * @brief Client-context and rate-limit fields reported alongside a response.
 *
 * Declares ResponseMetadata, an immutable snapshot of the organization,
 * request id, API version and rate-limit counters carried by API response
 * headers, together with the parsed reset durations.
 */
#ifndef RESETSPAN_RESPONSE_METADATA_HPP
#define RESETSPAN_RESPONSE_METADATA_HPP

#include "response_headers.hpp"
#include "util/duration.hpp"
#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace rspan {

/// Header names read by ResponseMetadata::from_headers().
namespace header_names {
inline constexpr const char *kProcessingMs = "openai-processing-ms";
inline constexpr const char *kOrganization = "openai-organization";
inline constexpr const char *kRequestId = "x-request-id";
inline constexpr const char *kVersion = "openai-version";
inline constexpr const char *kLimitRequests = "x-ratelimit-limit-requests";
inline constexpr const char *kLimitTokens = "x-ratelimit-limit-tokens";
inline constexpr const char *kRemainingRequests =
    "x-ratelimit-remaining-requests";
inline constexpr const char *kRemainingTokens = "x-ratelimit-remaining-tokens";
inline constexpr const char *kResetRequests = "x-ratelimit-reset-requests";
inline constexpr const char *kResetTokens = "x-ratelimit-reset-tokens";
} // namespace header_names

/**
 * Per-response metadata. All fields are set once when the object is built
 * and never change afterwards.
 */
class ResponseMetadata {
public:
  ResponseMetadata() = default;

  /**
   * Extract metadata from response headers.
   *
   * Counters that are not valid integers are left unset and logged; the raw
   * reset strings are stored as received and parsed on access.
   *
   * @param headers Headers of the response.
   * @param mode Parse mode used for the reset timestamps.
   * @return Populated metadata snapshot.
   */
  static ResponseMetadata
  from_headers(const ResponseHeaders &headers,
               TimestampParseMode mode = TimestampParseMode::Lenient);

  /// Server-side processing time reported by the API.
  const std::optional<std::chrono::milliseconds> &processing_time() const {
    return processing_time_;
  }

  /// Organization associated with the request.
  const std::string &organization() const { return organization_; }

  /// Request id, useful when contacting support about a specific call.
  const std::string &request_id() const { return request_id_; }

  /// API version that produced the response.
  const std::string &api_version() const { return api_version_; }

  /// Maximum number of requests permitted before the limit is exhausted.
  const std::optional<int> &limit_requests() const { return limit_requests_; }

  /// Maximum number of tokens permitted before the limit is exhausted.
  const std::optional<int> &limit_tokens() const { return limit_tokens_; }

  /// Remaining requests before the limit is exhausted.
  const std::optional<int> &remaining_requests() const {
    return remaining_requests_;
  }

  /// Remaining tokens before the limit is exhausted.
  const std::optional<int> &remaining_tokens() const {
    return remaining_tokens_;
  }

  /// Raw time until the request based limit resets (e.g. "1s").
  const std::string &reset_requests() const { return reset_requests_; }

  /// Raw time until the token based limit resets (e.g. "6m0s").
  const std::string &reset_tokens() const { return reset_tokens_; }

  /// Parse mode applied to the reset strings.
  TimestampParseMode parse_mode() const { return mode_; }

  /**
   * Time until the request based limit resets.
   *
   * @throws TimestampFormatError If the raw value is malformed.
   */
  std::chrono::milliseconds reset_requests_duration() const;

  /**
   * Time until the token based limit resets.
   *
   * @throws TimestampFormatError If the raw value is malformed.
   */
  std::chrono::milliseconds reset_tokens_duration() const;

  /**
   * Serialise the metadata. Durations are written in milliseconds; reset
   * values that fail to parse are written as null.
   */
  nlohmann::json to_json() const;

  /// JSON text of to_json(); @p indent follows nlohmann::json::dump().
  std::string to_json_string(int indent = -1) const;

private:
  std::optional<std::chrono::milliseconds> processing_time_;
  std::string organization_;
  std::string request_id_;
  std::string api_version_;
  std::optional<int> limit_requests_;
  std::optional<int> limit_tokens_;
  std::optional<int> remaining_requests_;
  std::optional<int> remaining_tokens_;
  std::string reset_requests_;
  std::string reset_tokens_;
  TimestampParseMode mode_{TimestampParseMode::Lenient};
};

} // namespace rspan

#endif // RESETSPAN_RESPONSE_METADATA_HPP
