#include "http_message.h"

#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <ctype.h>
#include <vector>

#include "util/string_utils.h"

namespace gridlink {
namespace http {

namespace {

constexpr const char RANGE_UNIT[] = "bytes=";

bool parseUnsigned(const std::string& text, uint64_t& out) {
  if (text.empty()) {
    return false;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    if (!isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  errno = 0;
  const unsigned long long value = strtoull(text.c_str(), nullptr, 10);
  if (errno == ERANGE) {
    return false;
  }
  out = static_cast<uint64_t>(value);
  return true;
}

}  // namespace

RangeParse parseByteRange(const std::string& value, uint64_t size, ByteRange& out) {
  const std::string v = util::trimCopy(util::view(value));
  const size_t unit_len = sizeof(RANGE_UNIT) - 1;
  if (v.size() < unit_len || util::toLower(util::view(v).substr(0, unit_len)) != RANGE_UNIT) {
    return RangeParse::MALFORMED;
  }
  const std::string bounds = util::trimCopy(util::view(v).substr(unit_len));
  if (bounds.find(',') != std::string::npos) {
    return RangeParse::MALFORMED;
  }
  const size_t dash = bounds.find('-');
  if (dash == std::string::npos) {
    return RangeParse::MALFORMED;
  }
  const std::string a = util::trimCopy(util::view(bounds).substr(0, dash));
  const std::string b = util::trimCopy(util::view(bounds).substr(dash + 1));

  if (a.empty()) {
    // Suffix form: the last n bytes.
    uint64_t n = 0;
    if (!parseUnsigned(b, n)) {
      return RangeParse::MALFORMED;
    }
    if (n == 0 || size == 0) {
      return RangeParse::UNSATISFIABLE;
    }
    out.first = n >= size ? 0 : size - n;
    out.last = size - 1;
    return RangeParse::OK;
  }

  uint64_t first = 0;
  if (!parseUnsigned(a, first)) {
    return RangeParse::MALFORMED;
  }
  uint64_t last = size == 0 ? 0 : size - 1;
  if (!b.empty()) {
    if (!parseUnsigned(b, last)) {
      return RangeParse::MALFORMED;
    }
    if (last < first) {
      return RangeParse::MALFORMED;
    }
  }
  if (first >= size) {
    return RangeParse::UNSATISFIABLE;
  }
  out.first = first;
  out.last = last >= size ? size - 1 : last;
  return RangeParse::OK;
}

bool parseRequestHead(const std::string& head, Request& out) {
  std::vector<std::string> lines = util::split(util::view(head), '\n');
  for (size_t i = 0; i < lines.size(); ++i) {
    if (!lines[i].empty() && lines[i][lines[i].size() - 1] == '\r') {
      lines[i].erase(lines[i].size() - 1);
    }
  }
  if (lines.empty()) {
    return false;
  }

  const std::vector<std::string> parts = util::split(util::view(lines[0]), ' ');
  if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[1][0] != '/') {
    return false;
  }
  out = Request();
  out.method = parts[0];
  out.path = parts[1].substr(0, parts[1].find('?'));
  out.version = parts[2];

  for (size_t i = 1; i < lines.size(); ++i) {
    if (lines[i].empty()) {
      break;
    }
    const size_t colon = lines[i].find(':');
    if (colon == std::string::npos) {
      return false;
    }
    const std::string name = util::toLower(util::view(lines[i]).substr(0, colon));
    if (util::trimCopy(util::view(name)) == "range") {
      out.range = util::trimCopy(util::view(lines[i]).substr(colon + 1));
    }
  }
  return true;
}

const char* reasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 206: return "Partial Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 416: return "Range Not Satisfiable";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    default:  break;
  }
  return "Unknown";
}

std::string responseHead(int status, uint64_t content_length, const std::string& extra_headers) {
  char line[128];
  snprintf(line, sizeof(line), "HTTP/1.1 %d %s\r\nContent-Length: %llu\r\n", status,
           reasonPhrase(status), static_cast<unsigned long long>(content_length));
  return std::string(line) + "Connection: close\r\n" + extra_headers + "\r\n";
}

}  // namespace http
}  // namespace gridlink
