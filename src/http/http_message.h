/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_HTTP_MESSAGE_H
#define GRIDLINK_HTTP_MESSAGE_H

#include <stdint.h>
#include <string>

#include <etl/optional.h>

namespace gridlink {
namespace http {

// Inclusive byte positions, as in Content-Range.
struct ByteRange {
  uint64_t first;
  uint64_t last;

  uint64_t length() const { return last - first + 1; }
};

enum class RangeParse : uint8_t {
  OK = 0,
  MALFORMED = 1,       // ignored: the full body is served
  UNSATISFIABLE = 2    // 416
};

/**
 * @brief Parse a single-range "Range" header value against a body size.
 *
 * Accepts "bytes=a-b", "bytes=a-" and the suffix form "bytes=-n". The end
 * is clamped to size - 1. Multi-range requests are MALFORMED.
 */
RangeParse parseByteRange(const std::string& value, uint64_t size, ByteRange& out);

struct Request {
  std::string method;
  std::string path;            // query string removed
  std::string version;
  etl::optional<std::string> range;
};

// Parses the request line and headers of a complete request head
// (everything before the blank line). Header names are case-insensitive.
bool parseRequestHead(const std::string& head, Request& out);

const char* reasonPhrase(int status);

// Status line plus headers, terminated by the blank line.
std::string responseHead(int status, uint64_t content_length, const std::string& extra_headers);

}  // namespace http
}  // namespace gridlink

#endif  // GRIDLINK_HTTP_MESSAGE_H
