/**
 * @file response_headers.hpp
 * @brief Case-insensitive access to raw HTTP response header lines.
 */
#ifndef RESETSPAN_RESPONSE_HEADERS_HPP
#define RESETSPAN_RESPONSE_HEADERS_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rspan {

/**
 * Response headers keyed by lowercase name.
 *
 * Accepts the `Name: value` lines delivered by a libcurl header callback or
 * written by `curl -D`. Status lines reset the collection so only the final
 * response of a redirect chain is kept.
 */
class ResponseHeaders {
public:
  ResponseHeaders() = default;

  /**
   * Build headers from individual lines. Trailing CR/LF is stripped, blank
   * lines and lines without a colon are ignored.
   *
   * @param lines Raw header lines in arrival order.
   * @return Collected headers of the last response.
   */
  static ResponseHeaders from_lines(const std::vector<std::string> &lines);

  /**
   * Read a header dump until end of stream.
   *
   * @param in Stream containing one header per line.
   * @return Collected headers of the last response.
   */
  static ResponseHeaders from_stream(std::istream &in);

  /**
   * Load a header dump from disk.
   *
   * @param path File written by `curl -D` or similar.
   * @throws std::runtime_error When the file cannot be opened.
   */
  static ResponseHeaders from_file(const std::string &path);

  /// Add or replace a header. Later values win.
  void set(const std::string &name, const std::string &value);

  /// Value of header @p name with surrounding whitespace removed.
  std::optional<std::string> find(const std::string &name) const;

  /// Whether header @p name is present.
  bool contains(const std::string &name) const;

  /// Number of distinct headers.
  std::size_t size() const { return headers_.size(); }

  /// HTTP status code of the last status line, 0 if none was seen.
  long status_code() const { return status_code_; }

private:
  void add_line(std::string line);

  std::unordered_map<std::string, std::string> headers_;
  long status_code_{0};
};

} // namespace rspan

#endif // RESETSPAN_RESPONSE_HEADERS_HPP
