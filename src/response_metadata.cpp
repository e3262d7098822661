#include "response_metadata.hpp"
#include "log.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rspan {

namespace {
std::shared_ptr<spdlog::logger> metadata_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("metadata");
  }();
  return logger;
}

std::string header_or_empty(const ResponseHeaders &headers, const char *name) {
  auto value = headers.find(name);
  return value ? *value : std::string{};
}

/**
 * Read an integer counter header. Values that are missing or do not form a
 * complete integer leave the counter unset.
 */
std::optional<int> int_header(const ResponseHeaders &headers,
                              const char *name) {
  auto value = headers.find(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    int parsed = std::stoi(*value, &idx);
    if (idx == value->size()) {
      return parsed;
    }
  } catch (const std::exception &) {
  }
  metadata_log()->warn("Ignoring malformed {} header '{}'", name, *value);
  return std::nullopt;
}

std::optional<std::chrono::milliseconds>
processing_time_header(const ResponseHeaders &headers) {
  auto value = headers.find(header_names::kProcessingMs);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    double ms = std::stod(*value, &idx);
    // max() rounds up to 2^63 as a double, which llround cannot represent
    const double limit =
        static_cast<double>(std::numeric_limits<long long>::max());
    if (idx == value->size() && ms >= 0 && std::isfinite(ms) && ms < limit) {
      return std::chrono::milliseconds(std::llround(ms));
    }
  } catch (const std::exception &) {
  }
  metadata_log()->warn("Ignoring malformed {} header '{}'",
                       header_names::kProcessingMs, *value);
  return std::nullopt;
}

nlohmann::json optional_to_json(const std::optional<int> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

/**
 * Export a raw reset string and its parsed form. A malformed value is kept
 * as raw text with a null duration.
 */
void reset_to_json(nlohmann::json &out, const char *key,
                   const std::string &raw, TimestampParseMode mode) {
  std::string ms_key = std::string(key) + "_ms";
  if (raw.empty()) {
    out[key] = nullptr;
    out[ms_key] = nullptr;
    return;
  }
  out[key] = raw;
  try {
    out[ms_key] = parse_reset_timestamp(raw, mode).count();
  } catch (const TimestampFormatError &e) {
    metadata_log()->warn("{}", e.what());
    out[ms_key] = nullptr;
  }
}
} // namespace

ResponseMetadata ResponseMetadata::from_headers(const ResponseHeaders &headers,
                                                TimestampParseMode mode) {
  ResponseMetadata meta;
  meta.mode_ = mode;
  meta.processing_time_ = processing_time_header(headers);
  meta.organization_ = header_or_empty(headers, header_names::kOrganization);
  meta.request_id_ = header_or_empty(headers, header_names::kRequestId);
  meta.api_version_ = header_or_empty(headers, header_names::kVersion);
  meta.limit_requests_ = int_header(headers, header_names::kLimitRequests);
  meta.limit_tokens_ = int_header(headers, header_names::kLimitTokens);
  meta.remaining_requests_ =
      int_header(headers, header_names::kRemainingRequests);
  meta.remaining_tokens_ = int_header(headers, header_names::kRemainingTokens);
  meta.reset_requests_ = header_or_empty(headers, header_names::kResetRequests);
  meta.reset_tokens_ = header_or_empty(headers, header_names::kResetTokens);
  metadata_log()->debug("Response metadata for request '{}' (reset requests "
                        "'{}', reset tokens '{}')",
                        meta.request_id_, meta.reset_requests_,
                        meta.reset_tokens_);
  return meta;
}

std::chrono::milliseconds ResponseMetadata::reset_requests_duration() const {
  return parse_reset_timestamp(reset_requests_, mode_);
}

std::chrono::milliseconds ResponseMetadata::reset_tokens_duration() const {
  return parse_reset_timestamp(reset_tokens_, mode_);
}

nlohmann::json ResponseMetadata::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  j["processing_time_ms"] = processing_time_
                                ? nlohmann::json(processing_time_->count())
                                : nlohmann::json(nullptr);
  j["organization"] = organization_;
  j["request_id"] = request_id_;
  j["api_version"] = api_version_;
  j["limit_requests"] = optional_to_json(limit_requests_);
  j["limit_tokens"] = optional_to_json(limit_tokens_);
  j["remaining_requests"] = optional_to_json(remaining_requests_);
  j["remaining_tokens"] = optional_to_json(remaining_tokens_);
  reset_to_json(j, "reset_requests", reset_requests_, mode_);
  reset_to_json(j, "reset_tokens", reset_tokens_, mode_);
  return j;
}

std::string ResponseMetadata::to_json_string(int indent) const {
  return to_json().dump(indent, ' ', false,
                        nlohmann::json::error_handler_t::replace);
}

} // namespace rspan
