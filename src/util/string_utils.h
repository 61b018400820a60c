#ifndef GRIDLINK_STRING_UTILS_H
#define GRIDLINK_STRING_UTILS_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <ctype.h>
#include <string>
#include <vector>
#include <etl/algorithm.h>
#include <etl/string_view.h>

namespace gridlink {
namespace util {

// Borrowed view of a std::string; the string must outlive the view.
inline etl::string_view view(const std::string& s) {
  return etl::string_view(s.data(), s.size());
}

/**
 * @brief ASCII lower-case copy of a string view.
 *
 * Device status text is plain ASCII; no locale handling is attempted.
 */
inline std::string toLower(etl::string_view text) {
  std::string out(text.begin(), text.end());
  etl::transform(out.begin(), out.end(), out.begin(), [](char c) {
    return static_cast<char>(tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

inline bool contains(etl::string_view haystack, etl::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  if (needle.size() > haystack.size()) {
    return false;
  }
  return haystack.find(needle) != etl::string_view::npos;
}

/**
 * @brief Case-insensitive substring test.
 *
 * @param haystack Text to search.
 * @param needle   Phrase to look for.
 * @return true if needle occurs anywhere in haystack ignoring ASCII case.
 */
inline bool containsIgnoreCase(etl::string_view haystack, etl::string_view needle) {
  const std::string h = toLower(haystack);
  const std::string n = toLower(needle);
  return h.find(n) != std::string::npos;
}

inline std::string trimCopy(etl::string_view text) {
  size_t first = 0;
  size_t last = text.size();
  while (first < last && isspace(static_cast<unsigned char>(text[first]))) {
    first++;
  }
  while (last > first && isspace(static_cast<unsigned char>(text[last - 1]))) {
    last--;
  }
  return std::string(text.begin() + first, text.begin() + last);
}

/**
 * @brief Split on a single delimiter, keeping empty segments.
 *
 * "a//b" yields {"a", "", "b"}, which keeps segment positions stable for
 * topic matching.
 */
inline std::vector<std::string> split(etl::string_view text, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  for (size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == delimiter) {
      parts.push_back(std::string(text.begin() + start, text.begin() + i));
      start = i + 1;
    }
  }
  return parts;
}

inline bool endsWith(etl::string_view text, etl::string_view suffix) {
  if (suffix.size() > text.size()) {
    return false;
  }
  return text.substr(text.size() - suffix.size()) == suffix;
}

/**
 * @brief Human readable transfer speed.
 *
 * Uses binary units like the device firmware logs: KB/s below 1024 KB/s,
 * MB/s above.
 */
inline std::string formatSpeed(double bytes_per_second) {
  char buf[32];
  const double kbps = bytes_per_second / 1024.0;
  if (kbps > 1024.0) {
    snprintf(buf, sizeof(buf), "%.1f MB/s", kbps / 1024.0);
  } else {
    snprintf(buf, sizeof(buf), "%.1f KB/s", kbps);
  }
  return std::string(buf);
}

}  // namespace util
}  // namespace gridlink

#endif
