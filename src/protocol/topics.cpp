#include "topics.h"

#include "util/string_utils.h"

namespace gridlink {
namespace topics {

std::string deviceTopic(const std::string& ns, const std::string& device,
                        const std::string& category) {
  return ns + "/" + device + "/" + category;
}

std::string anyDeviceTopic(const std::string& ns, const std::string& category) {
  return deviceTopic(ns, WILDCARD_SINGLE, category);
}

std::string coreDumpFilter(const std::string& ns, const std::string& device) {
  const std::string who = device.empty() ? std::string(WILDCARD_SINGLE) : device;
  return ns + "/" + who + "/" + CATEGORY_COREDUMP + "/" + WILDCARD_MULTI;
}

std::vector<std::string> sessionFilters(const std::string& ns, const std::string& device,
                                        bool include_coredump) {
  const std::string who = device.empty() ? std::string(WILDCARD_SINGLE) : device;
  std::vector<std::string> filters;
  filters.push_back(deviceTopic(ns, who, CATEGORY_STATUS));
  filters.push_back(deviceTopic(ns, who, CATEGORY_ERROR));
  if (include_coredump) {
    filters.push_back(coreDumpFilter(ns, device));
  }
  return filters;
}

bool matchesFilter(const std::string& filter, const std::string& topic) {
  const std::vector<std::string> f = util::split(util::view(filter), '/');
  const std::vector<std::string> t = util::split(util::view(topic), '/');

  size_t i = 0;
  for (; i < f.size(); ++i) {
    if (f[i] == WILDCARD_MULTI) {
      return i == f.size() - 1;
    }
    if (i >= t.size()) {
      return false;
    }
    if (f[i] != WILDCARD_SINGLE && f[i] != t[i]) {
      return false;
    }
  }
  return i == t.size();
}

}  // namespace topics
}  // namespace gridlink
