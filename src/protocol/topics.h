/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_TOPICS_H
#define GRIDLINK_TOPICS_H

#include <stddef.h>
#include <string>
#include <vector>

namespace gridlink {
namespace topics {

// Topic layout published by the grid monitor firmware:
//   <namespace>/<device-id>/<category>[/<subtype>...]
constexpr size_t NAMESPACE_SEGMENT = 0;
constexpr size_t DEVICE_SEGMENT = 1;
constexpr size_t CATEGORY_SEGMENT = 2;
constexpr size_t MIN_SEGMENTS = 3;

constexpr const char CATEGORY_MEASUREMENT[] = "measurement";
constexpr const char CATEGORY_STATUS[] = "status";
constexpr const char CATEGORY_ERROR[] = "error";
constexpr const char CATEGORY_COMMAND[] = "command";
constexpr const char CATEGORY_LOGS[] = "logs";
constexpr const char CATEGORY_COREDUMP[] = "coredump";

// Core dump subtype markers, matched as substrings of the full topic.
constexpr const char COREDUMP_HEADER_MARKER[] = "/header";
constexpr const char COREDUMP_CHUNK_MARKER[] = "/chunk/";
constexpr const char COREDUMP_COMPLETE_MARKER[] = "/complete";

constexpr const char WILDCARD_SINGLE[] = "+";
constexpr const char WILDCARD_MULTI[] = "#";

// <ns>/<device>/<category>
std::string deviceTopic(const std::string& ns, const std::string& device,
                        const std::string& category);

// <ns>/+/<category>, used for discovery and broadcast listening.
std::string anyDeviceTopic(const std::string& ns, const std::string& category);

// <ns>/<device>/coredump/# or <ns>/+/coredump/# when device is empty.
std::string coreDumpFilter(const std::string& ns, const std::string& device);

// Topic filters a session needs for one device (or every device when the
// id is empty): status, error and the core dump tree.
std::vector<std::string> sessionFilters(const std::string& ns, const std::string& device,
                                        bool include_coredump);

/**
 * @brief MQTT topic filter matching with '+' and '#'.
 *
 * '+' matches exactly one level, '#' matches the remaining levels
 * (including none) and must be the last level of the filter.
 */
bool matchesFilter(const std::string& filter, const std::string& topic);

}  // namespace topics
}  // namespace gridlink

#endif  // GRIDLINK_TOPICS_H
