#include "response_headers.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace rspan {

namespace {
std::shared_ptr<spdlog::logger> headers_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("headers");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string trim_copy(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

/**
 * Extract the numeric status from a line such as "HTTP/1.1 429 Too Many
 * Requests" or "HTTP/2 200".
 */
long parse_status_code(const std::string &line) {
  auto space = line.find(' ');
  if (space == std::string::npos) {
    return 0;
  }
  try {
    return std::stol(line.substr(space + 1));
  } catch (const std::exception &) {
    headers_log()->warn("Malformed status line '{}'", line);
    return 0;
  }
}
} // namespace

ResponseHeaders
ResponseHeaders::from_lines(const std::vector<std::string> &lines) {
  ResponseHeaders headers;
  for (const auto &line : lines) {
    headers.add_line(line);
  }
  return headers;
}

ResponseHeaders ResponseHeaders::from_stream(std::istream &in) {
  ResponseHeaders headers;
  std::string line;
  while (std::getline(in, line)) {
    headers.add_line(line);
  }
  headers_log()->debug("Read {} header(s), status {}", headers.size(),
                       headers.status_code());
  return headers;
}

ResponseHeaders ResponseHeaders::from_file(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    headers_log()->error("Failed to open header file {}", path);
    throw std::runtime_error("Failed to open header file: " + path);
  }
  return from_stream(in);
}

void ResponseHeaders::set(const std::string &name, const std::string &value) {
  headers_[to_lower_copy(trim_copy(name))] = trim_copy(value);
}

std::optional<std::string> ResponseHeaders::find(const std::string &name) const {
  auto it = headers_.find(to_lower_copy(name));
  if (it == headers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ResponseHeaders::contains(const std::string &name) const {
  return headers_.count(to_lower_copy(name)) > 0;
}

void ResponseHeaders::add_line(std::string line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  if (line.empty()) {
    return;
  }
  if (line.rfind("HTTP/", 0) == 0) {
    headers_.clear();
    status_code_ = parse_status_code(line);
    return;
  }
  auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) {
    headers_log()->debug("Ignoring header line without name: '{}'", line);
    return;
  }
  set(line.substr(0, colon), line.substr(colon + 1));
}

} // namespace rspan
